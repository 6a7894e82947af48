#include "common/process_utils.hpp"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace process {

namespace {

std::vector<char*> buildArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

} // namespace

bool runCommand(const std::vector<std::string>& args, CommandResult& result, std::string& error) {
    if (args.empty()) {
        error = "empty command";
        return false;
    }

    // Close-on-exec keeps concurrently spawned children from holding the write end open
    int outputPipe[2];
    if (::pipe2(outputPipe, O_CLOEXEC) != 0) {
        error = std::string("pipe failed: ") + strerror(errno);
        return false;
    }

    auto argv = buildArgv(args);
    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + strerror(errno);
        ::close(outputPipe[0]);
        ::close(outputPipe[1]);
        return false;
    }

    if (pid == 0) {
        ::dup2(outputPipe[1], STDOUT_FILENO);
        ::dup2(outputPipe[1], STDERR_FILENO);
        ::close(outputPipe[0]);
        ::close(outputPipe[1]);
        ::execvp(argv[0], argv.data());
        std::perror("execvp");
        ::_exit(127);
    }

    ::close(outputPipe[1]);

    result.output.clear();
    char buffer[4096];
    ssize_t n;
    while ((n = ::read(outputPipe[0], buffer, sizeof(buffer))) != 0) {
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        result.output.append(buffer, static_cast<size_t>(n));
    }
    ::close(outputPipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = std::string("waitpid failed: ") + strerror(errno);
            return false;
        }
    }

    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (result.exitCode == 127) {
        error = "command not found: " + args[0];
        return false;
    }
    return true;
}

pid_t spawn(const std::vector<std::string>& args, const std::string& logPath, std::string& error) {
    if (args.empty()) {
        error = "empty command";
        return -1;
    }

    auto argv = buildArgv(args);
    std::string target = logPath.empty() ? "/dev/null" : logPath;

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + strerror(errno);
        return -1;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd >= 0) {
            ::dup2(fd, STDOUT_FILENO);
            ::dup2(fd, STDERR_FILENO);
            ::close(fd);
        }
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::execvp(argv[0], argv.data());
        std::perror("execvp");
        ::_exit(127);
    }

    return pid;
}

bool reap(pid_t pid, int& exitStatus) {
    if (pid <= 0) {
        return true;
    }

    int status = 0;
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == pid) {
        exitStatus = status;
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        // Already reaped elsewhere
        return true;
    }
    return false;
}

bool terminate(pid_t pid, std::chrono::milliseconds grace, int& exitStatus) {
    if (pid <= 0) {
        return true;
    }

    if (reap(pid, exitStatus)) {
        return true;
    }

    ::kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(pid, exitStatus)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    exitStatus = status;
    return false;
}

bool isAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    int status = 0;
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == pid) {
        return false;
    }
    if (result == 0) {
        return true;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

bool terminateForeign(pid_t pid, std::chrono::milliseconds grace) {
    if (!isAlive(pid)) {
        return true;
    }

    ::kill(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!isAlive(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    ::kill(pid, SIGKILL);
    for (int i = 0; i < 20 && isAlive(pid); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

std::vector<std::string> readCommandLine(pid_t pid) {
    std::vector<std::string> args;
    std::ifstream file("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
    std::string arg;
    while (std::getline(file, arg, '\0')) {
        args.push_back(arg);
    }
    return args;
}

std::string describeExitStatus(int exitStatus) {
    std::stringstream ss;
    if (WIFEXITED(exitStatus)) {
        ss << "exited with code " << WEXITSTATUS(exitStatus);
    } else if (WIFSIGNALED(exitStatus)) {
        ss << "killed by signal " << WTERMSIG(exitStatus);
    } else {
        ss << "wait status " << exitStatus;
    }
    return ss.str();
}

std::string joinArguments(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

} // namespace process
