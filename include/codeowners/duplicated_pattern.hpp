#pragma once

#include "codeowners/check.hpp"

namespace codeowners {

/// "Duplicated Pattern Checker": every pattern declared more than once is
/// reported once, with the line of each declaration. Read-only.
Check duplicated_pattern_check();

} // namespace codeowners
