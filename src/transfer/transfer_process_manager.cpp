#include "transfer/transfer_process_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/process_utils.hpp"
#include <arpa/inet.h>
#include <filesystem>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

bool acceptsConnections(const std::string& host, int port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        return false;
    }

    bool connected = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return connected;
}

} // namespace

json TransferProcess::toJson() const {
    return {
        {"port", port},
        {"pid", pid},
        {"image_path", imagePath},
        {"export_name", exportName},
        {"owner_job_id", ownerJobId},
        {"disk_index", diskIndex},
        {"state", toString(state)},
        {"started_at", utils::formatTimestamp(startedAt)},
        {"failure_reason", failureReason}
    };
}

TransferProcessManager::TransferProcessManager(std::shared_ptr<TransferServerLauncher> launcher,
                                               TransferManagerOptions options)
    : launcher_(std::move(launcher))
    , options_(std::move(options)) {
    if (!launcher_) {
        throw std::invalid_argument("transfer process manager requires a launcher");
    }
}

TransferProcessManager::~TransferProcessManager() {
    stopAll();
}

TransferProcess TransferProcessManager::start(int port, const std::string& imagePath,
                                              const std::string& exportName, int sharedReaders,
                                              const std::string& ownerJobId, int diskIndex) {
    std::error_code ec;
    if (!std::filesystem::exists(imagePath, ec)) {
        Logger::error("Refusing to start transfer on port " + std::to_string(port) +
                      ": image " + imagePath + " does not exist");
        throw BackupError(ErrorKind::TRANSFER_PROCESS_START_FAILED,
                          "image file does not exist: " + imagePath, ownerJobId);
    }

    auto entry = std::make_shared<Entry>();
    std::unique_lock<std::mutex> entryLock(entry->mutex);
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        if (processes_.count(port) > 0) {
            throw BackupError(ErrorKind::TRANSFER_PROCESS_START_FAILED,
                              "port " + std::to_string(port) + " already has a transfer process",
                              ownerJobId);
        }
        processes_[port] = entry;
    }

    TransferProcess& process = entry->process;
    process.port = port;
    process.imagePath = imagePath;
    process.exportName = exportName;
    process.ownerJobId = ownerJobId;
    process.diskIndex = diskIndex;
    process.state = TransferState::STARTING;
    process.startedAt = std::chrono::system_clock::now();

    TransferLaunchRequest request;
    request.port = port;
    request.imagePath = imagePath;
    request.exportName = exportName;
    request.sharedReaders = sharedReaders;
    request.bindAddress = options_.bindAddress;
    if (!options_.logDir.empty()) {
        request.logPath = (std::filesystem::path(options_.logDir) /
                           ("transfer-" + std::to_string(port) + ".log")).string();
    }

    std::string error;
    process.pid = launcher_->launch(request, error);
    if (process.pid < 0) {
        process.state = TransferState::FAILED;
        entryLock.unlock();
        eraseEntry(port, entry);
        Logger::error("Failed to launch " + launcher_->getName() + " on port " +
                      std::to_string(port) + ": " + error);
        throw BackupError(ErrorKind::TRANSFER_PROCESS_START_FAILED,
                          "failed to launch transfer server on port " + std::to_string(port) +
                          ": " + error, ownerJobId);
    }

    if (!waitUntilReady(process, error)) {
        if (process.state != TransferState::FAILED) {
            int status = 0;
            process::terminate(process.pid, options_.stopGrace, status);
            process.exitStatus = status;
        }
        process.state = TransferState::FAILED;
        process.failureReason = error;
        entryLock.unlock();
        eraseEntry(port, entry);
        Logger::error("Transfer server on port " + std::to_string(port) + " failed to start: " + error);
        throw BackupError(ErrorKind::TRANSFER_PROCESS_START_FAILED,
                          "transfer server on port " + std::to_string(port) + " failed to start: " + error,
                          ownerJobId);
    }

    process.state = TransferState::RUNNING;
    Logger::info("Transfer server pid " + std::to_string(process.pid) + " serving " + imagePath +
                 " as '" + exportName + "' on port " + std::to_string(port));
    return process;
}

bool TransferProcessManager::waitUntilReady(TransferProcess& process, std::string& error) {
    auto deadline = std::chrono::steady_clock::now() + options_.startupTimeout;
    std::string host = probeHost();

    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        if (process::reap(process.pid, status)) {
            process.exitStatus = status;
            process.state = TransferState::FAILED;
            error = "process " + process::describeExitStatus(status) + " before accepting connections";
            return false;
        }
        if (acceptsConnections(host, process.port)) {
            // A stray listener answers while our process is still failing to bind
            std::this_thread::sleep_for(options_.probeInterval);
            if (process::reap(process.pid, status)) {
                process.exitStatus = status;
                process.state = TransferState::FAILED;
                error = "port is served by another process; ours " + process::describeExitStatus(status);
                return false;
            }
            return true;
        }
        std::this_thread::sleep_for(options_.probeInterval);
    }

    error = "not accepting connections after " + std::to_string(options_.startupTimeout.count()) + "ms";
    return false;
}

bool TransferProcessManager::stop(int port) {
    auto entry = findEntry(port);
    if (!entry) {
        Logger::debug("Stop requested for port " + std::to_string(port) + " with no transfer process");
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        TransferProcess& process = entry->process;
        if (process.state != TransferState::STOPPED) {
            bool wasRunning = process.state != TransferState::FAILED;
            process.state = TransferState::STOPPING;
            if (wasRunning) {
                int status = 0;
                bool graceful = process::terminate(process.pid, options_.stopGrace, status);
                process.exitStatus = status;
                if (!graceful) {
                    Logger::warning("Transfer server pid " + std::to_string(process.pid) + " on port " +
                                    std::to_string(port) + " ignored SIGTERM and was killed");
                }
            }
            process.state = TransferState::STOPPED;
            Logger::info("Stopped transfer server on port " + std::to_string(port) + " (job " +
                         process.ownerJobId + ")");

            // qemu-nbd releases its image lock slightly after exit
            std::this_thread::sleep_for(options_.releaseDelay);
        }
    }

    eraseEntry(port, entry);
    return true;
}

bool TransferProcessManager::stopStrayServer(pid_t pid, int port) {
    if (pid <= 0) {
        return false;
    }
    for (const auto& process : listProcesses()) {
        if (process.pid == pid) {
            return false;
        }
    }
    if (!launcher_->isServerProcess(pid, port)) {
        Logger::debug("Recorded pid " + std::to_string(pid) + " is not a " + launcher_->getName() +
                      " on port " + std::to_string(port));
        return false;
    }

    Logger::warning("Stopping stray " + launcher_->getName() + " pid " + std::to_string(pid) +
                    " on port " + std::to_string(port));
    if (!process::terminateForeign(pid, options_.stopGrace)) {
        Logger::warning("Stray transfer server pid " + std::to_string(pid) + " ignored SIGTERM and was killed");
    }
    return true;
}

size_t TransferProcessManager::stopAllForJob(const std::string& ownerJobId) {
    auto ports = getPortsForJob(ownerJobId);
    for (int port : ports) {
        stop(port);
    }
    return ports.size();
}

void TransferProcessManager::stopAll() {
    std::vector<int> ports;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        for (const auto& entry : processes_) {
            ports.push_back(entry.first);
        }
    }
    for (int port : ports) {
        stop(port);
    }
}

std::vector<int> TransferProcessManager::getPortsForJob(const std::string& ownerJobId) const {
    std::vector<int> ports;
    for (const auto& entry : allEntries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->process.ownerJobId == ownerJobId) {
            ports.push_back(entry->process.port);
        }
    }
    return ports;
}

bool TransferProcessManager::healthCheck(int port) {
    auto entry = findEntry(port);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->process.state != TransferState::RUNNING) {
        return false;
    }
    return !markIfExited(entry->process);
}

bool TransferProcessManager::markIfExited(TransferProcess& process) {
    int status = 0;
    if (!process::reap(process.pid, status)) {
        return false;
    }

    process.exitStatus = status;
    process.state = TransferState::FAILED;
    process.failureReason = "transfer server " + process::describeExitStatus(status);
    Logger::error("Transfer server pid " + std::to_string(process.pid) + " on port " +
                  std::to_string(process.port) + " for job " + process.ownerJobId + " " +
                  process::describeExitStatus(status));
    return true;
}

size_t TransferProcessManager::sweep() {
    std::vector<TransferProcess> failed;

    for (const auto& entry : allEntries()) {
        std::unique_lock<std::mutex> lock(entry->mutex, std::try_to_lock);
        if (!lock.owns_lock()) {
            // Being started or stopped right now
            continue;
        }
        if (entry->process.state == TransferState::RUNNING) {
            markIfExited(entry->process);
        }
        if (entry->process.state == TransferState::FAILED && !entry->failureReported) {
            entry->failureReported = true;
            failed.push_back(entry->process);
        }
    }

    TransferFailureCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = failureCallback_;
    }
    if (callback) {
        for (const auto& process : failed) {
            callback(process);
        }
    }
    return failed.size();
}

std::vector<TransferProcess> TransferProcessManager::listProcesses() const {
    std::vector<TransferProcess> processes;
    for (const auto& entry : allEntries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        processes.push_back(entry->process);
    }
    return processes;
}

bool TransferProcessManager::getProcess(int port, TransferProcess& process) const {
    auto entry = findEntry(port);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    process = entry->process;
    return true;
}

size_t TransferProcessManager::getProcessCount() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return processes_.size();
}

void TransferProcessManager::setFailureCallback(TransferFailureCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    failureCallback_ = std::move(callback);
}

std::shared_ptr<TransferProcessManager::Entry> TransferProcessManager::findEntry(int port) const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = processes_.find(port);
    return it == processes_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<TransferProcessManager::Entry>> TransferProcessManager::allEntries() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    std::vector<std::shared_ptr<Entry>> entries;
    entries.reserve(processes_.size());
    for (const auto& entry : processes_) {
        entries.push_back(entry.second);
    }
    return entries;
}

void TransferProcessManager::eraseEntry(int port, const std::shared_ptr<Entry>& entry) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = processes_.find(port);
    if (it != processes_.end() && it->second == entry) {
        processes_.erase(it);
    }
}

std::string TransferProcessManager::probeHost() const {
    if (options_.bindAddress.empty() || options_.bindAddress == "0.0.0.0") {
        return "127.0.0.1";
    }
    return options_.bindAddress;
}
