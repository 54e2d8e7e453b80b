#pragma once

#include "codeowners/check.hpp"
#include "codeowners/not_owned_file.hpp"

#include <string>
#include <vector>

namespace codeowners {

struct CheckSelection {
    std::vector<std::string> checks;               // stable check names
    std::vector<std::string> experimental_checks;
    NotOwnedFileConfig       not_owned;
};

/// Names accepted in CheckSelection::checks.
std::vector<std::string> stable_check_names();

/// Names accepted in CheckSelection::experimental_checks.
std::vector<std::string> experimental_check_names();

/**
 * Builds the configured checks: stable ones first, then experimental ones,
 * each group in configuration order. Stable checks report at Error severity,
 * experimental checks at Warning.
 *
 * Throws std::invalid_argument for an unknown name, or for a known name listed
 * in the wrong group.
 */
std::vector<ConfiguredCheck> load_checks(const CheckSelection& selection);

} // namespace codeowners
