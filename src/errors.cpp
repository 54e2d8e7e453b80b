#include "codeowners/errors.hpp"

#include <sstream>

namespace codeowners {

namespace {

std::string describe_command_failure(const std::string& command_line, int exit_code,
                                     const std::string& diagnostics) {
    std::ostringstream os;
    os << "command \"" << command_line << "\" failed with exit code " << exit_code;
    if (!diagnostics.empty()) os << ": " << diagnostics;
    return os.str();
}

std::string describe_all(const std::vector<std::string>& messages) {
    if (messages.size() == 1) return messages.front();

    std::ostringstream os;
    os << messages.size() << " errors occurred:";
    for (const auto& m : messages)
        os << "\n\t* " << m;
    return os.str();
}

} // namespace

CommandError::CommandError(std::string command_line, int exit_code, std::string diagnostics)
    : std::runtime_error(describe_command_failure(command_line, exit_code, diagnostics)),
      command_line_(std::move(command_line)),
      exit_code_(exit_code),
      diagnostics_(std::move(diagnostics)) {}

MultiError::MultiError(std::vector<std::string> messages)
    : std::runtime_error(describe_all(messages)),
      messages_(std::move(messages)) {}

} // namespace codeowners
