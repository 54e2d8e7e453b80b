#pragma once

#include "codeowners/check_runner.hpp"

#include <ostream>
#include <string>

namespace codeowners {

/// "[inf]", "[war]" or "[err]".
std::string severity_label(SeverityLevel level);

/**
 * Human-readable run summary:
 *
 *   ==> Executing Duplicated Pattern Checker (3ms)
 *       [err] line 4: Pattern "*.md" is defined 2 times ...
 *
 *   1 check(s) executed, 1 failure(s)
 */
void print_report(std::ostream& os, const RunReport& report);

} // namespace codeowners
