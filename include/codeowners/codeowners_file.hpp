#pragma once

#include "codeowners/types.hpp"

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace codeowners {

/// First existing CODEOWNERS among <repo>/, <repo>/.github/, <repo>/docs/.
std::optional<std::string> find_codeowners_file(const std::string& repo_dir);

/// One entry per non-blank, non-comment line: the first field is the pattern,
/// the remaining whitespace-separated fields are owners.
std::vector<OwnershipEntry> read_entries(std::istream& in);

/// Locates and reads the repository's ownership file.
/// Throws std::runtime_error when none exists or it cannot be opened.
std::vector<OwnershipEntry> load_entries(const std::string& repo_dir);

} // namespace codeowners
