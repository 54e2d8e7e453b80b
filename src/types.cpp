#include "codeowners/types.hpp"

#include <algorithm>
#include <cctype>

namespace codeowners {

std::string to_string(SeverityLevel level) {
    switch (level) {
        case SeverityLevel::Info:    return "info";
        case SeverityLevel::Warning: return "warning";
        case SeverityLevel::Error:   return "error";
        default:                     return "unknown";
    }
}

std::optional<SeverityLevel> parse_severity(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "info")                     return SeverityLevel::Info;
    if (lower == "warning" || lower == "warn") return SeverityLevel::Warning;
    if (lower == "error" || lower == "err")    return SeverityLevel::Error;
    return std::nullopt;
}

} // namespace codeowners
