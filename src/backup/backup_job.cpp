#include "backup/backup_job.hpp"
#include <algorithm>

using json = nlohmann::json;

json DiskResult::toJson() const {
    return {
        {"disk_index", diskIndex},
        {"disk_key", diskKey},
        {"source_path", sourcePath},
        {"capacity_bytes", capacityBytes},
        {"port", port},
        {"export_name", exportName},
        {"image_path", imagePath},
        {"qemu_process_pid", qemuProcessPid},
        {"bytes_transferred", bytesTransferred},
        {"total_bytes", totalBytes},
        {"progress_percent", progressPercent},
        {"status", toString(status)},
        {"change_tracking_id", changeTrackingId},
        {"previous_change_tracking_id", previousChangeTrackingId},
        {"parent_backup_id", parentBackupId},
        {"backup_id", backupId},
        {"error_message", errorMessage},
        {"last_telemetry_at", utils::formatTimestamp(lastTelemetryAt)}
    };
}

DiskResult* BackupJobRecord::findDisk(int diskIndex) {
    for (auto& disk : disks) {
        if (disk.diskIndex == diskIndex) {
            return &disk;
        }
    }
    return nullptr;
}

const DiskResult* BackupJobRecord::findDisk(int diskIndex) const {
    for (const auto& disk : disks) {
        if (disk.diskIndex == diskIndex) {
            return &disk;
        }
    }
    return nullptr;
}

bool BackupJobRecord::allDisksTerminal() const {
    return !disks.empty() && std::all_of(disks.begin(), disks.end(),
        [](const DiskResult& disk) { return isTerminal(disk.status); });
}

bool BackupJobRecord::allDisksCompleted() const {
    return !disks.empty() && std::all_of(disks.begin(), disks.end(),
        [](const DiskResult& disk) { return disk.status == DiskStatus::COMPLETED; });
}

const DiskResult* BackupJobRecord::firstFailedDisk() const {
    for (const auto& disk : disks) {
        if (disk.status == DiskStatus::FAILED) {
            return &disk;
        }
    }
    return nullptr;
}

json BackupJobRecord::toJson() const {
    json diskArray = json::array();
    for (const auto& disk : disks) {
        diskArray.push_back(disk.toJson());
    }

    json doc = {
        {"job_id", jobId},
        {"vm_identifier", vmIdentifier},
        {"backup_type", toString(backupType)},
        {"status", toString(status)},
        {"phase", toString(phase)},
        {"created_at", utils::formatTimestamp(createdAt)},
        {"started_at", utils::formatTimestamp(startedAt)},
        {"completed_at", utils::formatTimestamp(completedAt)},
        {"error_message", errorMessage},
        {"error_kind", errorKindToString(errorKind)},
        {"snapshot_id", snapshotId},
        {"target_descriptor", targetDescriptor},
        {"bytes_transferred", bytesTransferred},
        {"total_bytes", totalBytes},
        {"progress_percent", progressPercent},
        {"current_phase", currentPhase},
        {"last_telemetry_at", utils::formatTimestamp(lastTelemetryAt)},
        {"disk_results", diskArray}
    };
    return doc;
}

BackupJob::BackupJob(const std::string& vmIdentifier, BackupType type) {
    setId(generateId());
    record_.jobId = id_;
    record_.vmIdentifier = vmIdentifier;
    record_.backupType = type;
    record_.createdAt = std::chrono::system_clock::now();
}

BackupJob::BackupJob(const BackupJobRecord& record)
    : record_(record) {
    setId(record.jobId);
}

JobStatus BackupJob::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.status;
}

std::string BackupJob::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.errorMessage;
}

JobPhase BackupJob::getPhase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.phase;
}

std::string BackupJob::getVmIdentifier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.vmIdentifier;
}

BackupType BackupJob::getBackupType() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.backupType;
}

BackupJobRecord BackupJob::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

void BackupJob::modify(const std::function<void(BackupJobRecord&)>& fn) {
    JobStatus before;
    JobStatus after;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before = record_.status;
        fn(record_);
        after = record_.status;
    }
    if (before != after) {
        notifyStatus(after);
    }
}

void BackupJob::setPhase(JobPhase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_.phase = phase;
}

bool BackupJob::beginFinalize() {
    bool expected = false;
    return finalizing_.compare_exchange_strong(expected, true);
}
