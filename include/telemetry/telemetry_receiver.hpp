#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/backup_status.hpp"
#include "common/utils.hpp"

class BackupCoordinator;

struct DiskTelemetry {
    int diskIndex{0};
    uint64_t bytesTransferred{0};
    uint64_t totalBytes{0};
    double progressPercent{0.0};
    std::string status;
    std::string changeId;
    std::string error;
};

// Progress report pushed by the capture agent
struct TelemetryUpdate {
    std::string jobId;
    std::string jobType;
    std::string status;
    std::string currentPhase;
    uint64_t bytesTransferred{0};
    uint64_t totalBytes{0};
    uint64_t transferSpeedBps{0};
    int64_t etaSeconds{0};
    double progressPercent{0.0};
    TimePoint timestamp{};
    std::vector<DiskTelemetry> disks;
    std::string errorMessage;
    std::string errorCode;

    // Throws BackupError(INVALID_REQUEST) on a malformed body
    static TelemetryUpdate fromJson(const nlohmann::json& j);
};

struct TelemetrySnapshot {
    uint64_t bytesTransferred{0};
    uint64_t totalBytes{0};
    uint64_t transferSpeedBps{0};
    double progressPercent{0.0};
    std::string currentPhase;
    TimePoint timestamp{};
    DiskStatus status{DiskStatus::TRANSFERRING};
    std::string changeId;
    std::string errorMessage;
};

class TelemetryReceiver {
public:
    explicit TelemetryReceiver(std::shared_ptr<BackupCoordinator> coordinator);

    // Returns false when the update was older than the last one applied for the
    // disk or the job is already finished. Throws BackupError(NOT_FOUND) for an
    // unknown job and BackupError(INVALID_REQUEST) for an unknown disk.
    bool receiveUpdate(const std::string& jobId, int diskIndex, const TelemetrySnapshot& snapshot);

    // Applies every disk entry of an agent report; returns the number applied
    size_t receiveJobUpdate(const std::string& jobType, const std::string& jobId,
                            const TelemetryUpdate& update);

    bool completeDisk(const std::string& jobId, int diskIndex, const std::string& changeId,
                      uint64_t bytesTransferred);

private:
    bool jobIsFinished(const std::string& jobId);
    DiskStatus normalizeStatus(const std::string& status) const;

    std::shared_ptr<BackupCoordinator> coordinator_;
};
