#include "codeowners/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace codeowners {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[noreturn]] void invalid(const std::string& name, const std::string& value, const std::string& expected) {
    throw std::invalid_argument(std::string(kEnvPrefix) + name + "=\"" + value +
                                "\" is invalid: expected " + expected);
}

bool parse_bool(const std::string& name, const std::string& value) {
    auto v = lowercase(trim(value));
    if (v == "true" || v == "1" || v == "yes")  return true;
    if (v == "false" || v == "0" || v == "no" || v.empty()) return false;
    invalid(name, value, "true or false");
}

} // namespace

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::string::size_type start = 0;
    while (start <= value.size()) {
        auto end = value.find(',', start);
        if (end == std::string::npos) end = value.size();
        auto item = trim(value.substr(start, end - start));
        if (!item.empty()) items.push_back(item);
        start = end + 1;
    }
    return items;
}

AppConfig load_config(const EnvLookup& lookup) {
    AppConfig cfg;

    auto repo = lookup("REPOSITORY_PATH");
    if (!repo || trim(*repo).empty()) {
        throw std::invalid_argument(std::string(kEnvPrefix) + "REPOSITORY_PATH is required");
    }
    cfg.repository_path = trim(*repo);

    if (auto level = lookup("CHECK_FAILURE_LEVEL")) {
        auto parsed = parse_severity(trim(*level));
        if (!parsed) invalid("CHECK_FAILURE_LEVEL", *level, "info, warning or error");
        cfg.check_failure_level = *parsed;
    }

    if (auto checks = lookup("CHECKS")) {
        cfg.selection.checks = split_list(*checks);
    } else {
        cfg.selection.checks = stable_check_names();
    }

    if (auto experimental = lookup("EXPERIMENTAL_CHECKS"))
        cfg.selection.experimental_checks = split_list(*experimental);

    if (auto skip = lookup("NOT_OWNED_CHECKER_SKIP_PATTERNS"))
        cfg.selection.not_owned.skip_patterns = split_list(*skip);

    if (auto subdirs = lookup("NOT_OWNED_CHECKER_SUBDIRECTORIES"))
        cfg.selection.not_owned.subdirectories = split_list(*subdirs);

    if (auto trust = lookup("NOT_OWNED_CHECKER_TRUST_WORKSPACE"))
        cfg.selection.not_owned.trust_workspace = parse_bool("NOT_OWNED_CHECKER_TRUST_WORKSPACE", *trust);

    if (auto format = lookup("OUTPUT_FORMAT")) {
        auto f = lowercase(trim(*format));
        if (f == "text" || f.empty()) {
            cfg.output_format = OutputFormat::Text;
        } else if (f == "json") {
            cfg.output_format = OutputFormat::Json;
        } else {
            invalid("OUTPUT_FORMAT", *format, "text or json");
        }
    }

    return cfg;
}

AppConfig load_config_from_environment() {
    return load_config([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv((std::string(kEnvPrefix) + name).c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    });
}

} // namespace codeowners
