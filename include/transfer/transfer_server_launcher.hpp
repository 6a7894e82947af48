#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

struct TransferLaunchRequest {
    int port{0};
    std::string imagePath;
    std::string exportName;
    int sharedReaders{10};
    std::string bindAddress{"127.0.0.1"};
    std::string logPath;
};

// Starts the OS process that serves one image over NBD on one port.
class TransferServerLauncher {
public:
    virtual ~TransferServerLauncher() = default;

    // Returns the child pid, or -1 with error set
    virtual pid_t launch(const TransferLaunchRequest& request, std::string& error) = 0;
    virtual std::string getName() const = 0;

    // True when pid is a server this launcher would have started on port
    virtual bool isServerProcess(pid_t pid, int port) const = 0;
};

class QemuNbdLauncher : public TransferServerLauncher {
public:
    explicit QemuNbdLauncher(const std::string& binary = "qemu-nbd");

    pid_t launch(const TransferLaunchRequest& request, std::string& error) override;
    std::string getName() const override { return "qemu-nbd"; }
    bool isServerProcess(pid_t pid, int port) const override;

    std::vector<std::string> buildArguments(const TransferLaunchRequest& request) const;
    bool matchesCommandLine(const std::vector<std::string>& args, int port) const;

private:
    std::string binary_;
};
