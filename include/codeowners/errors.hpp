#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace codeowners {

/// A version-control command exited non-zero or could not be started.
class CommandError : public std::runtime_error {
public:
    CommandError(std::string command_line, int exit_code, std::string diagnostics);

    const std::string& command_line() const { return command_line_; }
    int exit_code() const { return exit_code_; }
    const std::string& diagnostics() const { return diagnostics_; }

private:
    std::string command_line_;
    int         exit_code_;
    std::string diagnostics_;
};

class CancelledError : public std::runtime_error {
public:
    CancelledError() : std::runtime_error("operation was cancelled") {}
};

/// Several independent failures reported together, none masking another.
class MultiError : public std::runtime_error {
public:
    explicit MultiError(std::vector<std::string> messages);

    const std::vector<std::string>& messages() const { return messages_; }

private:
    std::vector<std::string> messages_;
};

} // namespace codeowners
