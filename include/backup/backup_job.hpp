#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/backup_status.hpp"
#include "common/errors.hpp"
#include "common/job.hpp"
#include "common/utils.hpp"

struct DiskResult {
    int diskIndex{0};
    std::string diskKey;
    std::string sourcePath;
    uint64_t capacityBytes{0};
    int port{0};
    std::string exportName;
    std::string imagePath;
    int qemuProcessPid{0};
    uint64_t bytesTransferred{0};
    uint64_t totalBytes{0};
    double progressPercent{0.0};
    DiskStatus status{DiskStatus::PENDING};
    std::string changeTrackingId;
    std::string previousChangeTrackingId;
    std::string parentBackupId;
    std::string backupId;
    std::string errorMessage;
    TimePoint lastTelemetryAt{};

    nlohmann::json toJson() const;
};

struct BackupJobRecord {
    std::string jobId;
    std::string vmIdentifier;
    BackupType backupType{BackupType::FULL};
    JobStatus status{JobStatus::PENDING};
    JobPhase phase{JobPhase::PENDING};
    TimePoint createdAt{};
    TimePoint startedAt{};
    TimePoint completedAt{};
    std::string errorMessage;
    ErrorKind errorKind{ErrorKind::NONE};
    std::string snapshotId;
    std::string targetDescriptor;
    uint64_t bytesTransferred{0};
    uint64_t totalBytes{0};
    double progressPercent{0.0};
    std::string currentPhase;
    TimePoint lastTelemetryAt{};
    std::vector<DiskResult> disks;

    DiskResult* findDisk(int diskIndex);
    const DiskResult* findDisk(int diskIndex) const;
    bool allDisksTerminal() const;
    bool allDisksCompleted() const;
    const DiskResult* firstFailedDisk() const;

    nlohmann::json toJson() const;
};

// Live handle for a job owned by the coordinator. All record access goes
// through snapshot()/modify() so telemetry and finalization never interleave.
class BackupJob : public Job {
public:
    BackupJob(const std::string& vmIdentifier, BackupType type);
    explicit BackupJob(const BackupJobRecord& record);

    JobStatus getStatus() const override;
    std::string getError() const override;
    JobPhase getPhase() const;
    std::string getVmIdentifier() const;
    BackupType getBackupType() const;

    BackupJobRecord snapshot() const;

    // Applies fn under the job lock; fires the status callback on a status change
    void modify(const std::function<void(BackupJobRecord&)>& fn);

    void setPhase(JobPhase phase);

    // Returns true exactly once per job
    bool beginFinalize();
    bool isFinalizing() const { return finalizing_; }

    void requestCancel() { cancelRequested_ = true; }
    bool isCancelRequested() const { return cancelRequested_; }

private:
    BackupJobRecord record_;
    std::atomic<bool> finalizing_{false};
    std::atomic<bool> cancelRequested_{false};
};
