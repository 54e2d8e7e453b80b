#pragma once

#include "codeowners/cancellation.hpp"
#include "codeowners/check.hpp"
#include "codeowners/types.hpp"

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

namespace codeowners {

enum class RunOutcome { Completed, Cancelled, Aborted };

inline std::ostream& operator<<(std::ostream& os, RunOutcome o) {
    switch (o) {
        case RunOutcome::Completed: return os << "Completed";
        case RunOutcome::Cancelled: return os << "Cancelled";
        case RunOutcome::Aborted:   return os << "Aborted";
        default:                    return os << "Unknown";
    }
}

struct CheckResult {
    std::string               name;
    SeverityLevel             severity;
    CheckOutput               output;
    std::chrono::milliseconds duration{ 0 };
};

struct RunReport {
    std::vector<CheckResult> results;    // executed checks, in execution order
    RunOutcome               outcome = RunOutcome::Completed;
    std::string              failed_check;   // Aborted: the check that raised
    std::string              error;          // Aborted: its error message

    /// Executed checks that reported at least one issue.
    std::size_t failure_count() const {
        std::size_t count = 0;
        for (const auto& r : results)
            if (!r.output.passed()) ++count;
        return count;
    }

    /// True when a check with issues has severity >= threshold.
    bool exceeds(SeverityLevel threshold) const {
        for (const auto& r : results)
            if (!r.output.passed() && r.severity >= threshold) return true;
        return false;
    }
};

/**
 * CheckRunner
 *
 * Runs the configured checks one after another against the same input.
 *
 *   1. The token is consulted before each check; once cancelled no further
 *      check starts and the run ends as Cancelled.
 *   2. A check that throws ends the run as Aborted; later checks never run.
 *   3. Issues never stop the run. They count as failures when the check's
 *      severity meets the failure threshold.
 *
 * A check marked mutates_workspace runs under lock_workspace() for the input
 * repository, so no other runner in the process touches that tree meanwhile.
 */
class CheckRunner {
public:
    explicit CheckRunner(SeverityLevel failure_threshold);

    void add_check(ConfiguredCheck check);

    RunReport run(const CheckInput& input, const CancellationToken& token);

    /// Result of the last run against the threshold; false before any run.
    bool should_fail() const;

    const RunReport& last_report() const { return last_report_; }

    SeverityLevel failure_threshold() const { return threshold_; }

    std::size_t check_count() const { return checks_.size(); }

private:
    SeverityLevel                threshold_;
    std::vector<ConfiguredCheck> checks_;
    RunReport                    last_report_;
};

} // namespace codeowners
