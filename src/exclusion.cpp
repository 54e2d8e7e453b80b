#include "codeowners/exclusion.hpp"

namespace codeowners {

std::vector<std::string> compute_excluded_patterns(const std::vector<OwnershipEntry>& entries,
                                                   const std::set<std::string>& skip) {
    std::vector<std::string> patterns;
    patterns.reserve(entries.size());
    for (const auto& entry : entries) {
        if (skip.count(entry.pattern) > 0) continue;
        patterns.push_back(entry.pattern);
    }
    return patterns;
}

} // namespace codeowners
