#pragma once

#include "codeowners/registry.hpp"
#include "codeowners/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace codeowners {

enum class OutputFormat { Text, Json };

struct AppConfig {
    std::string    repository_path;
    SeverityLevel  check_failure_level = SeverityLevel::Warning;
    CheckSelection selection;
    OutputFormat   output_format = OutputFormat::Text;
};

constexpr const char* kEnvPrefix = "CODEOWNERS_";

// Returns the value of a variable (name without prefix), or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * Reads the configuration from CODEOWNERS_* variables:
 *
 *   REPOSITORY_PATH                     required
 *   CHECK_FAILURE_LEVEL                 info | warning | error (default warning)
 *   CHECKS                              default "duppatterns"
 *   EXPERIMENTAL_CHECKS                 default empty
 *   NOT_OWNED_CHECKER_SKIP_PATTERNS
 *   NOT_OWNED_CHECKER_SUBDIRECTORIES
 *   NOT_OWNED_CHECKER_TRUST_WORKSPACE   true | false (default false)
 *   OUTPUT_FORMAT                       text | json (default text)
 *
 * Lists are comma-separated; blank items are dropped. Throws
 * std::invalid_argument naming the offending variable.
 */
AppConfig load_config(const EnvLookup& lookup);

/// load_config() over the process environment.
AppConfig load_config_from_environment();

std::vector<std::string> split_list(const std::string& value);

} // namespace codeowners
