#pragma once

#include "codeowners/check_runner.hpp"

#include <cstdio>
#include <sstream>
#include <string>

namespace codeowners {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline std::string outcome_str(RunOutcome o) {
    switch (o) {
        case RunOutcome::Completed: return "completed";
        case RunOutcome::Cancelled: return "cancelled";
        case RunOutcome::Aborted:   return "aborted";
        default:                    return "unknown";
    }
}

} // namespace json_detail

inline std::string to_json(const Issue& issue) {
    std::ostringstream os;
    os << "{ \"message\": " << json_detail::quoted(issue.message);
    if (issue.line_no) os << ", \"line\": " << *issue.line_no;
    os << " }";
    return os.str();
}

inline std::string to_json(const CheckResult& result) {
    std::ostringstream os;
    os << "{\n"
       << "      \"name\": "        << json_detail::quoted(result.name) << ",\n"
       << "      \"severity\": "    << json_detail::quoted(to_string(result.severity)) << ",\n"
       << "      \"duration_ms\": " << result.duration.count() << ",\n"
       << "      \"passed\": "      << (result.output.passed() ? "true" : "false") << ",\n"
       << "      \"issues\": [";
    const auto& issues = result.output.issues;
    for (std::size_t i = 0; i < issues.size(); ++i) {
        os << "\n        " << to_json(issues[i]);
        if (i + 1 < issues.size()) os << ",";
    }
    os << (issues.empty() ? "]" : "\n      ]") << "\n"
       << "    }";
    return os.str();
}

inline std::string to_json(const RunReport& report, SeverityLevel threshold) {
    std::ostringstream os;
    os << "{\n"
       << "  \"outcome\": "             << json_detail::quoted(json_detail::outcome_str(report.outcome)) << ",\n"
       << "  \"failure_threshold\": "   << json_detail::quoted(to_string(threshold)) << ",\n"
       << "  \"exceeds_threshold\": "   << (report.exceeds(threshold) ? "true" : "false") << ",\n";
    if (report.outcome == RunOutcome::Aborted) {
        os << "  \"error\": { \"check\": " << json_detail::quoted(report.failed_check)
           << ", \"message\": " << json_detail::quoted(report.error) << " },\n";
    }
    os << "  \"checks\": [";
    for (std::size_t i = 0; i < report.results.size(); ++i) {
        os << "\n    " << to_json(report.results[i]);
        if (i + 1 < report.results.size()) os << ",";
    }
    os << (report.results.empty() ? "]" : "\n  ]") << "\n"
       << "}";
    return os.str();
}

} // namespace codeowners
