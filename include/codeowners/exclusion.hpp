#pragma once

#include "codeowners/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace codeowners {

/// Patterns to apply as exclusion rules: every entry's pattern in declaration
/// order, minus exact matches in `skip`. Duplicates are kept.
std::vector<std::string> compute_excluded_patterns(const std::vector<OwnershipEntry>& entries,
                                                   const std::set<std::string>& skip);

} // namespace codeowners
