#include "codeowners/registry.hpp"
#include "codeowners/duplicated_pattern.hpp"

#include <algorithm>
#include <stdexcept>

namespace codeowners {

namespace {

bool listed(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::string join(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace

std::vector<std::string> stable_check_names() {
    return { "duppatterns" };
}

std::vector<std::string> experimental_check_names() {
    return { "notowned" };
}

std::vector<ConfiguredCheck> load_checks(const CheckSelection& selection) {
    const auto stable       = stable_check_names();
    const auto experimental = experimental_check_names();

    for (const auto& name : selection.checks) {
        if (listed(stable, name)) continue;
        if (listed(experimental, name)) {
            throw std::invalid_argument("check \"" + name + "\" is experimental; enable it via experimental checks");
        }
        throw std::invalid_argument("unknown check \"" + name + "\" (known: " + join(stable) + ")");
    }
    for (const auto& name : selection.experimental_checks) {
        if (!listed(experimental, name)) {
            throw std::invalid_argument("unknown experimental check \"" + name +
                                        "\" (known: " + join(experimental) + ")");
        }
    }

    std::vector<ConfiguredCheck> checks;
    for (const auto& name : selection.checks) {
        if (name == "duppatterns")
            checks.push_back({ duplicated_pattern_check(), SeverityLevel::Error });
    }
    for (const auto& name : selection.experimental_checks) {
        if (name == "notowned")
            checks.push_back({ not_owned_file_check(selection.not_owned), SeverityLevel::Warning });
    }
    return checks;
}

} // namespace codeowners
