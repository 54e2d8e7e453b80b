#pragma once

#include <string>
#include <vector>

namespace codeowners {

/**
 * Result of a process execution
 */
struct ProcessResult {
    int         exit_code = -1;
    std::string output;   // stdout
    std::string error;    // stderr

    bool success() const { return exit_code == 0; }
};

/**
 * Runs `command` (looked up on PATH) with `args` inside `working_dir` and
 * captures both output streams. Blocks until the child exits. A child that
 * cannot change directory or exec reports exit code 127.
 *
 * Throws std::system_error when the pipes or the fork cannot be created.
 */
ProcessResult run_process(const std::string& command,
                          const std::vector<std::string>& args,
                          const std::string& working_dir = "");

/// Space-joined command line, used in diagnostics only.
std::string format_command_line(const std::string& command,
                                const std::vector<std::string>& args);

} // namespace codeowners
