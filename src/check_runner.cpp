#include "codeowners/check_runner.hpp"
#include "codeowners/errors.hpp"
#include "codeowners/git.hpp"
#include "codeowners/logging.hpp"

#include <exception>
#include <mutex>

namespace codeowners {

CheckRunner::CheckRunner(SeverityLevel failure_threshold) : threshold_(failure_threshold) {}

void CheckRunner::add_check(ConfiguredCheck check) {
    checks_.push_back(std::move(check));
}

RunReport CheckRunner::run(const CheckInput& input, const CancellationToken& token) {
    RunReport report;

    for (const auto& configured : checks_) {
        const auto& check = configured.check;
        if (token.is_cancelled()) {
            report.outcome = RunOutcome::Cancelled;
            break;
        }

        // Held across the whole check, restoration included.
        std::unique_lock<std::mutex> workspace;
        if (check.mutates_workspace) {
            workspace = lock_workspace(input.repository_directory, std::try_to_lock);
            if (!workspace.owns_lock()) {
                log_info("waiting for exclusive access to " + input.repository_directory);
                workspace = lock_workspace(input.repository_directory);
            }
        }

        const auto started = std::chrono::steady_clock::now();
        try {
            CheckOutput output = check.run(input, token);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            report.results.push_back({ check.name, configured.severity, std::move(output), elapsed });
        } catch (const CancelledError&) {
            report.outcome = RunOutcome::Cancelled;
            break;
        } catch (const std::exception& e) {
            log_error("check \"" + check.name + "\" failed: " + e.what());
            report.outcome      = RunOutcome::Aborted;
            report.failed_check = check.name;
            report.error        = e.what();
            break;
        }
    }

    if (report.outcome == RunOutcome::Cancelled) {
        log_warn("check run was cancelled after " + std::to_string(report.results.size()) +
                 " of " + std::to_string(checks_.size()) + " check(s)");
    }

    last_report_ = report;
    return report;
}

bool CheckRunner::should_fail() const {
    return last_report_.exceeds(threshold_);
}

} // namespace codeowners
