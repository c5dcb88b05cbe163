#pragma once

#include <stash/result.hpp>
#include <string>
#include <vector>

namespace stash {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// timeout_seconds <= 0 waits without a limit.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Run an external command with the caller's stdin/stdout/stderr attached.
// Returns the child's exit code; a child killed by a signal yields 128 + signo.
Result<int> run_interactive(const std::vector<std::string>& args,
                            const std::string& working_dir = "",
                            int timeout_seconds = 0);

} // namespace stash
