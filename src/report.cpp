#include "codeowners/report.hpp"

namespace codeowners {

std::string severity_label(SeverityLevel level) {
    switch (level) {
        case SeverityLevel::Info:    return "[inf]";
        case SeverityLevel::Warning: return "[war]";
        case SeverityLevel::Error:   return "[err]";
        default:                     return "[???]";
    }
}

void print_report(std::ostream& os, const RunReport& report) {
    for (const auto& result : report.results) {
        os << "==> Executing " << result.name << " (" << result.duration.count() << "ms)\n";
        if (result.output.passed()) {
            os << "    Check OK\n";
            continue;
        }
        for (const auto& issue : result.output.issues) {
            os << "    " << severity_label(result.severity) << " ";
            if (issue.line_no) os << "line " << *issue.line_no << ": ";
            os << issue.message << "\n";
        }
    }

    if (report.outcome == RunOutcome::Aborted) {
        os << "==> Executing " << report.failed_check << "\n"
           << "    [err] " << report.error << "\n";
    }

    const auto failures = report.failure_count();
    os << "\n" << report.results.size() << " check(s) executed, ";
    if (failures == 0) {
        os << "no failure(s)";
    } else {
        os << failures << " failure(s)";
    }
    if (report.outcome != RunOutcome::Completed) os << " (" << report.outcome << ")";
    os << "\n";
}

} // namespace codeowners
