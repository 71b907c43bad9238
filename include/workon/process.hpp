#pragma once

#include <workon/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace workon {

struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

using EnvVars = std::vector<std::pair<std::string, std::string>>;

// Run an external command, capturing stdout and stderr.
// `env` entries are added to the inherited environment of the child.
// A timeout of 0 waits indefinitely. Returns an error on fork/exec
// plumbing failure or timeout; a non-zero exit is reported in exit_code.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const EnvVars& env = {});

// Strip trailing newlines / carriage returns.
std::string trim_output(std::string s);

} // namespace workon
