#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace codeowners {

enum class SeverityLevel { Info = 0, Warning = 1, Error = 2 };

struct OwnershipEntry {
    std::size_t              line_no = 0;   // 1-based line in the ownership file, 0 if unknown
    std::string              pattern;
    std::vector<std::string> owners;
};

struct CheckInput {
    std::string                 repository_directory;
    std::vector<OwnershipEntry> entries;
};

struct Issue {
    std::string                message;
    std::optional<std::size_t> line_no;
};

struct CheckOutput {
    std::vector<Issue> issues;

    bool passed() const { return issues.empty(); }
};

/// Collects issues in report order. Mirrors how checks build their output.
class OutputBuilder {
public:
    void report_issue(std::string message) {
        output_.issues.push_back({ std::move(message), std::nullopt });
    }
    void report_issue(std::string message, std::size_t line_no) {
        output_.issues.push_back({ std::move(message), line_no });
    }

    CheckOutput output() const { return output_; }

private:
    CheckOutput output_;
};

std::string to_string(SeverityLevel level);

/// Accepts "info", "warning"/"warn", "error"/"err" in any case.
std::optional<SeverityLevel> parse_severity(const std::string& text);

inline std::ostream& operator<<(std::ostream& os, SeverityLevel level) {
    return os << to_string(level);
}

} // namespace codeowners
