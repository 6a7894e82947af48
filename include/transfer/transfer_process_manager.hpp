#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/backup_status.hpp"
#include "common/utils.hpp"
#include "transfer/transfer_server_launcher.hpp"

struct TransferProcess {
    int port{0};
    pid_t pid{-1};
    std::string imagePath;
    std::string exportName;
    std::string ownerJobId;
    int diskIndex{0};
    TransferState state{TransferState::STARTING};
    TimePoint startedAt{};
    int exitStatus{0};
    std::string failureReason;

    nlohmann::json toJson() const;
};

struct TransferManagerOptions {
    std::string bindAddress{"127.0.0.1"};
    std::chrono::milliseconds startupTimeout{10000};
    std::chrono::milliseconds stopGrace{5000};
    std::chrono::milliseconds releaseDelay{100};
    std::chrono::milliseconds probeInterval{100};
    std::string logDir;
};

using TransferFailureCallback = std::function<void(const TransferProcess& process)>;

// Owns one transfer-server process per port. The table lock only guards
// lookup/insert/erase; each entry has its own lock so different ports never
// wait on each other.
class TransferProcessManager {
public:
    TransferProcessManager(std::shared_ptr<TransferServerLauncher> launcher,
                           TransferManagerOptions options = TransferManagerOptions());
    ~TransferProcessManager();

    TransferProcessManager(const TransferProcessManager&) = delete;
    TransferProcessManager& operator=(const TransferProcessManager&) = delete;

    // Returns once the process accepts TCP connections on the port.
    // Throws BackupError(TRANSFER_PROCESS_START_FAILED).
    TransferProcess start(int port, const std::string& imagePath, const std::string& exportName,
                          int sharedReaders, const std::string& ownerJobId, int diskIndex);

    // Safe on unknown or already stopped ports
    bool stop(int port);
    size_t stopAllForJob(const std::string& ownerJobId);

    // Stops a server left behind by an earlier run, after confirming pid is
    // still a transfer server on port. Returns true if one was stopped.
    bool stopStrayServer(pid_t pid, int port);
    void stopAll();

    std::vector<int> getPortsForJob(const std::string& ownerJobId) const;
    bool healthCheck(int port);

    // Reaps exited processes, marks them failed and reports each one once.
    // Returns the number of newly failed processes.
    size_t sweep();

    std::vector<TransferProcess> listProcesses() const;
    bool getProcess(int port, TransferProcess& process) const;
    size_t getProcessCount() const;

    void setFailureCallback(TransferFailureCallback callback);

private:
    struct Entry {
        std::mutex mutex;
        TransferProcess process;
        bool failureReported{false};
    };

    std::shared_ptr<Entry> findEntry(int port) const;
    std::vector<std::shared_ptr<Entry>> allEntries() const;
    void eraseEntry(int port, const std::shared_ptr<Entry>& entry);
    bool waitUntilReady(TransferProcess& process, std::string& error);
    bool markIfExited(TransferProcess& process);
    std::string probeHost() const;

    std::shared_ptr<TransferServerLauncher> launcher_;
    TransferManagerOptions options_;
    std::map<int, std::shared_ptr<Entry>> processes_;
    mutable std::mutex tableMutex_;
    TransferFailureCallback failureCallback_;
    std::mutex callbackMutex_;
};
