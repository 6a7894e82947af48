#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

struct CommandResult {
    int exitCode{-1};
    std::string output;
};

namespace process {

// Runs argv[0] from PATH and waits, capturing stdout and stderr together.
// Returns false only when the process could not be run at all.
bool runCommand(const std::vector<std::string>& args, CommandResult& result, std::string& error);

// Starts a detached child with stdout/stderr redirected to logPath
// (or /dev/null when empty). Returns the pid, or -1 with error set.
pid_t spawn(const std::vector<std::string>& args, const std::string& logPath, std::string& error);

// Non-blocking reap. True when the child has exited; exitStatus holds the raw wait status.
bool reap(pid_t pid, int& exitStatus);

// SIGTERM, wait up to grace, then SIGKILL. Always reaps the child.
// Returns true if the process exited within the grace period.
bool terminate(pid_t pid, std::chrono::milliseconds grace, int& exitStatus);

// Works for processes started by an earlier run, which this one cannot wait on.
// SIGTERM, poll up to grace, then SIGKILL. Returns true if it exited within grace.
bool terminateForeign(pid_t pid, std::chrono::milliseconds grace);
bool isAlive(pid_t pid);

// Arguments from /proc/<pid>/cmdline; empty when the process is gone
std::vector<std::string> readCommandLine(pid_t pid);

std::string describeExitStatus(int exitStatus);

std::string joinArguments(const std::vector<std::string>& args);

} // namespace process
