#pragma once

#include "codeowners/cancellation.hpp"
#include "codeowners/types.hpp"

#include <functional>
#include <string>

namespace codeowners {

// A Check inspects the shared input and returns its issues, or throws on an
// operational failure. It must observe the token before any long-running step.
using CheckFn = std::function<CheckOutput(const CheckInput&, const CancellationToken&)>;

struct Check {
    std::string name;
    std::string description;
    bool        mutates_workspace = false;  // needs exclusive use of the working tree
    CheckFn     run;
};

/// A Check as selected by configuration, with the severity its issues carry.
struct ConfiguredCheck {
    Check         check;
    SeverityLevel severity = SeverityLevel::Error;
};

} // namespace codeowners
