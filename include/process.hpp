#pragma once

#include <string>

namespace vid2slides {

struct CommandResult {
    int exit_code = -1;
    std::string output; // stdout and stderr combined
};

// Runs a shell command and captures its output.
// Throws std::runtime_error if the process cannot be started.
CommandResult run_command(const std::string& command);

// True if `program` resolves on PATH
bool command_available(const std::string& program);

// Single-quotes text for /bin/sh
std::string shell_quote(const std::string& text);

} // namespace vid2slides
