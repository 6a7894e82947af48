#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "backup/capture_agent_client.hpp"
#include "backup/vm_inventory.hpp"
#include "common/errors.hpp"
#include "storage/image_manager.hpp"
#include "transfer/transfer_server_launcher.hpp"

// Images are small JSON files recording size and backing path, so chain
// validation can run without qemu-img.
class FakeImageManager : public ImageManager {
public:
    bool createFull(const std::string& path, uint64_t sizeBytes, std::string& error) override {
        return write(path, sizeBytes, "", error);
    }

    bool createIncremental(const std::string& path, const std::string& backingPath,
                           std::string& error) override {
        ImageInfo parent;
        if (!getInfo(backingPath, parent, error)) {
            return false;
        }
        return write(path, parent.virtualSize, backingPath, error);
    }

    bool getInfo(const std::string& path, ImageInfo& info, std::string& error) override {
        std::ifstream file(path);
        if (!file.is_open()) {
            error = "no such image: " + path;
            return false;
        }
        nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
        if (doc.is_discarded()) {
            error = "corrupt image: " + path;
            return false;
        }
        info.path = path;
        info.format = "qcow2";
        info.virtualSize = doc.value("virtual_size", static_cast<uint64_t>(0));
        info.actualSize = doc.value("actual_size", static_cast<uint64_t>(4096));
        info.backingFile = doc.value("backing", "");
        return true;
    }

    bool check(const std::string& path, std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failCheck_.count(path)) {
            error = "corruption found in " + path;
            return false;
        }
        return exists(path);
    }

    void failCreationContaining(const std::string& fragment) {
        std::lock_guard<std::mutex> lock(mutex_);
        failCreate_ = fragment;
    }

    // Creation of matching paths blocks for delay before succeeding
    void delayCreationContaining(const std::string& fragment, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delayFragment_ = fragment;
        delay_ = delay;
    }

    void failCheckFor(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        failCheck_.insert(path);
    }

    // Rewrites the backing reference of an existing image
    void rebase(const std::string& path, const std::string& backing) {
        std::ifstream in(path);
        nlohmann::json doc = nlohmann::json::parse(in);
        in.close();
        doc["backing"] = backing;
        std::ofstream out(path, std::ios::trunc);
        out << doc.dump();
    }

private:
    bool write(const std::string& path, uint64_t size, const std::string& backing, std::string& error) {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!failCreate_.empty() && path.find(failCreate_) != std::string::npos) {
                error = "simulated create failure";
                return false;
            }
            if (!delayFragment_.empty() && path.find(delayFragment_) != std::string::npos) {
                delay = delay_;
            }
        }
        std::this_thread::sleep_for(delay);
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open()) {
            error = "cannot write " + path;
            return false;
        }
        nlohmann::json doc = {{"virtual_size", size}, {"actual_size", 4096}, {"backing", backing}};
        out << doc.dump();
        return true;
    }

    std::mutex mutex_;
    std::string failCreate_;
    std::string delayFragment_;
    std::chrono::milliseconds delay_{0};
    std::set<std::string> failCheck_;
};

class FakeCaptureAgent : public CaptureAgent {
public:
    CaptureResponse startCapture(const CaptureRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        calls_++;
        if (onCapture) {
            onCapture(request);
        }
        if (failWith != ErrorKind::NONE) {
            throw BackupError(failWith, "simulated agent failure", request.jobId);
        }
        CaptureResponse response;
        response.accepted = true;
        response.jobId = request.jobId;
        response.snapshotId = "snapshot-" + std::to_string(calls_.load());
        return response;
    }

    int calls() const { return calls_; }

    CaptureRequest lastRequest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.empty() ? CaptureRequest() : requests_.back();
    }

    ErrorKind failWith{ErrorKind::NONE};
    std::function<void(const CaptureRequest&)> onCapture;

private:
    mutable std::mutex mutex_;
    std::vector<CaptureRequest> requests_;
    std::atomic<int> calls_{0};
};

class FakeInventory : public VmInventory {
public:
    void addVm(const std::string& vmIdentifier, int diskCount, uint64_t capacity = 1024 * 1024) {
        std::vector<DiskInfo> disks;
        for (int i = 0; i < diskCount; ++i) {
            DiskInfo disk;
            disk.diskIndex = i;
            disk.diskKey = std::to_string(2000 + i);
            disk.sourcePath = "[ds1] " + vmIdentifier + "/disk" + std::to_string(i) + ".vmdk";
            disk.capacityBytes = capacity;
            disks.push_back(disk);
        }
        vms_[vmIdentifier] = disks;
    }

    bool resolveDisks(const std::string& vmIdentifier, std::vector<DiskInfo>& disks,
                      std::string& error) override {
        auto it = vms_.find(vmIdentifier);
        if (it == vms_.end()) {
            error = "unknown VM " + vmIdentifier;
            return false;
        }
        disks = it->second;
        return true;
    }

private:
    std::map<std::string, std::vector<DiskInfo>> vms_;
};

// Forks a child that listens on the requested port in place of qemu-nbd.
class ListeningLauncher : public TransferServerLauncher {
public:
    enum class Mode {
        LISTEN,          // serve until signalled
        EXIT_AT_ONCE,    // dies before listening
        NEVER_LISTEN,    // stays alive but never opens the port
        LISTEN_THEN_DIE  // listens, then exits after dieAfter
    };

    explicit ListeningLauncher(Mode mode = Mode::LISTEN) : mode_(mode) {}

    pid_t launch(const TransferLaunchRequest& request, std::string& error) override {
        launches_++;
        Mode mode = modeFor(request.port);
        pid_t pid = fork();
        if (pid < 0) {
            error = "fork failed";
            return -1;
        }
        if (pid == 0) {
            runChild(mode, request.port);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        launched_[pid] = request.port;
        return pid;
    }

    std::string getName() const override { return "listening-fake"; }

    bool isServerProcess(pid_t pid, int port) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = launched_.find(pid);
        return it != launched_.end() && it->second == port;
    }

    void setModeForPort(int port, Mode mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        portModes_[port] = mode;
    }

    int launches() const { return launches_; }

    std::chrono::milliseconds dieAfter{300};

private:
    Mode modeFor(int port) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = portModes_.find(port);
        return it == portModes_.end() ? mode_ : it->second;
    }

    [[noreturn]] void runChild(Mode mode, int port) {
        if (mode == Mode::EXIT_AT_ONCE) {
            _exit(1);
        }
        if (mode == Mode::NEVER_LISTEN) {
            for (;;) {
                pause();
            }
        }

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (fd < 0 || bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || listen(fd, 4) < 0) {
            _exit(2);
        }

        if (mode == Mode::LISTEN_THEN_DIE) {
            usleep(static_cast<useconds_t>(dieAfter.count() * 1000));
            _exit(3);
        }
        for (;;) {
            pause();
        }
    }

    Mode mode_;
    mutable std::mutex mutex_;
    std::map<int, Mode> portModes_;
    std::map<pid_t, int> launched_;
    std::atomic<int> launches_{0};
};

// Unique scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("diskchain-test-" + std::to_string(getpid()) + "-" + std::to_string(counter()++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    static std::atomic<int>& counter() {
        static std::atomic<int> value{0};
        return value;
    }

    std::filesystem::path path_;
};
