#pragma once

#include <reclint/result.hpp>
#include <string>
#include <vector>

namespace reclint {

struct CommandResult {
    int exit_code;          // -1 when the child was killed by a signal
    std::string stdout_str;
    std::string stderr_str;

    bool success() const { return exit_code == 0; }
};

// Run an external command and wait for it, capturing stdout and stderr.
// There is no timeout: a command that never exits blocks the caller.
// Failure to start the program (not found, not executable) is a Process
// error rather than a non-zero exit.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "");

// Replace every "{file}" in `exec` with `file` and split the result on
// whitespace. No quoting is recognised.
std::vector<std::string> expand_command(const std::string& exec, const std::string& file);

} // namespace reclint
