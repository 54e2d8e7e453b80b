#include "codeowners/check_runner.hpp"
#include "codeowners/codeowners_file.hpp"
#include "codeowners/config.hpp"
#include "codeowners/json.hpp"
#include "codeowners/logging.hpp"
#include "codeowners/registry.hpp"
#include "codeowners/report.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>

using namespace codeowners;

namespace {

constexpr int kExitOk            = 0;
constexpr int kExitError         = 1;
constexpr int kExitInterrupted   = 2;
constexpr int kExitCheckFailure  = 3;

// SIGINT/SIGTERM are blocked everywhere and consumed here, so cancellation
// happens on an ordinary thread instead of inside a signal handler.
void watch_signals(CancellationToken token) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    std::thread([set, token]() mutable {
        int sig = 0;
        if (sigwait(&set, &sig) == 0) token.cancel();
    }).detach();
}

} // namespace

int main() {
    CancellationToken token;
    watch_signals(token);

    AppConfig cfg;
    std::vector<ConfiguredCheck> checks;
    CheckInput input;
    try {
        cfg    = load_config_from_environment();
        checks = load_checks(cfg.selection);
        input.repository_directory = std::filesystem::absolute(cfg.repository_path).lexically_normal().string();
        input.entries              = load_entries(input.repository_directory);
    } catch (const std::exception& e) {
        log_error(e.what());
        return kExitError;
    }

    CheckRunner runner(cfg.check_failure_level);
    for (auto& check : checks)
        runner.add_check(std::move(check));

    auto report = runner.run(input, token);

    if (cfg.output_format == OutputFormat::Json) {
        std::cout << to_json(report, runner.failure_threshold()) << "\n";
    } else {
        print_report(std::cout, report);
    }

    if (token.is_cancelled() || report.outcome == RunOutcome::Cancelled) {
        log_error("Application was interrupted by operating system");
        return kExitInterrupted;
    }
    if (report.outcome == RunOutcome::Aborted) {
        return kExitError;
    }
    if (runner.should_fail()) {
        return kExitCheckFailure;
    }
    return kExitOk;
}
