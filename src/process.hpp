#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace cerberus_dash {

// A child process whose stdout is readable through stdout_fd. stderr is
// sent to /dev/null.
struct ChildProcess {
    pid_t pid = -1;
    int stdout_fd = -1;
};

// Fork and exec argv[0] (PATH lookup). Throws std::system_error if the pipe
// cannot be created, the fork fails, or the exec itself fails (missing or
// non-executable binary).
ChildProcess spawn_process(const std::vector<std::string>& argv);

// SIGTERM the child, reap it, and close stdout_fd if still owned.
void terminate_process(ChildProcess& child);

struct CommandResult {
    int exit_code = -1;
    std::string output;
};

// Run to completion and capture stdout. Returns nullopt if the command
// cannot be started or does not finish within `timeout` (it is killed).
std::optional<CommandResult> run_command(const std::vector<std::string>& argv,
                                         std::chrono::milliseconds timeout);

} // namespace cerberus_dash
