#include "telemetry/telemetry_receiver.hpp"
#include "backup/backup_coordinator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>

namespace {

template <typename T>
T readNumber(const nlohmann::json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number()) {
        throw BackupError(ErrorKind::INVALID_REQUEST, std::string("field ") + key + " must be a number");
    }
    return it->get<T>();
}

std::string readString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw BackupError(ErrorKind::INVALID_REQUEST, std::string("field ") + key + " must be a string");
    }
    return it->get<std::string>();
}

} // namespace

TelemetryUpdate TelemetryUpdate::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw BackupError(ErrorKind::INVALID_REQUEST, "telemetry body must be a JSON object");
    }

    TelemetryUpdate update;
    update.jobId = readString(j, "job_id");
    update.jobType = readString(j, "job_type");
    update.status = readString(j, "status");
    update.currentPhase = readString(j, "current_phase");
    update.bytesTransferred = readNumber<uint64_t>(j, "bytes_transferred", 0);
    update.totalBytes = readNumber<uint64_t>(j, "total_bytes", 0);
    update.transferSpeedBps = readNumber<uint64_t>(j, "transfer_speed_bps", 0);
    update.etaSeconds = readNumber<int64_t>(j, "eta_seconds", 0);
    update.progressPercent = readNumber<double>(j, "progress_percent", 0.0);

    std::string timestamp = readString(j, "timestamp");
    if (timestamp.empty()) {
        update.timestamp = std::chrono::system_clock::now();
    } else if (!utils::parseTimestamp(timestamp, update.timestamp)) {
        throw BackupError(ErrorKind::INVALID_REQUEST, "invalid timestamp: " + timestamp);
    }

    if (j.contains("disks") && !j["disks"].is_null()) {
        if (!j["disks"].is_array()) {
            throw BackupError(ErrorKind::INVALID_REQUEST, "disks must be an array");
        }
        for (const auto& entry : j["disks"]) {
            if (!entry.is_object() || !entry.contains("disk_index")) {
                throw BackupError(ErrorKind::INVALID_REQUEST, "every disk entry needs a disk_index");
            }
            DiskTelemetry disk;
            disk.diskIndex = readNumber<int>(entry, "disk_index", 0);
            disk.bytesTransferred = readNumber<uint64_t>(entry, "bytes_transferred", 0);
            disk.totalBytes = readNumber<uint64_t>(entry, "total_bytes", 0);
            disk.progressPercent = readNumber<double>(entry, "progress_percent", 0.0);
            disk.status = readString(entry, "status");
            disk.changeId = readString(entry, "change_id");
            disk.error = readString(entry, "error");
            update.disks.push_back(disk);
        }
    }

    auto error = j.find("error");
    if (error != j.end() && !error->is_null()) {
        if (error->is_string()) {
            update.errorMessage = error->get<std::string>();
        } else if (error->is_object()) {
            update.errorMessage = readString(*error, "message");
            update.errorCode = readString(*error, "code");
            if (update.errorMessage.empty()) {
                update.errorMessage = update.errorCode.empty() ? "capture agent reported an error"
                                                               : update.errorCode;
            }
        }
    }
    return update;
}

TelemetryReceiver::TelemetryReceiver(std::shared_ptr<BackupCoordinator> coordinator)
    : coordinator_(std::move(coordinator)) {
    if (!coordinator_) {
        throw std::invalid_argument("telemetry receiver needs a coordinator");
    }
}

bool TelemetryReceiver::jobIsFinished(const std::string& jobId) {
    BackupJobRecord record;
    if (coordinator_->getJob(jobId, record)) {
        Logger::debug("Ignoring telemetry for finished job " + jobId);
        return true;
    }
    throw BackupError(ErrorKind::NOT_FOUND, "unknown job " + jobId, jobId);
}

DiskStatus TelemetryReceiver::normalizeStatus(const std::string& status) const {
    DiskStatus parsed = DiskStatus::TRANSFERRING;
    if (status.empty() || !diskStatusFromString(status, parsed)) {
        return DiskStatus::TRANSFERRING;
    }
    // The agent never moves a disk back before transfer
    if (parsed == DiskStatus::PENDING || parsed == DiskStatus::PROVISIONED) {
        return DiskStatus::TRANSFERRING;
    }
    return parsed;
}

bool TelemetryReceiver::receiveUpdate(const std::string& jobId, int diskIndex,
                                      const TelemetrySnapshot& snapshot) {
    auto job = coordinator_->findActiveJob(jobId);
    if (!job) {
        jobIsFinished(jobId);
        return false;
    }
    if (!job->snapshot().findDisk(diskIndex)) {
        throw BackupError(ErrorKind::INVALID_REQUEST,
                          "job has no disk " + std::to_string(diskIndex), jobId);
    }

    bool applied = false;
    bool resumed = false;
    TimePoint arrival = std::chrono::system_clock::now();
    job->modify([&](BackupJobRecord& record) {
        // Arrival of any report proves the agent is alive
        record.lastTelemetryAt = arrival;
        if (record.status == JobStatus::STALLED) {
            record.status = JobStatus::RUNNING;
            resumed = true;
        }

        DiskResult* disk = record.findDisk(diskIndex);
        if (isTerminal(disk->status)) {
            return;
        }
        if (disk->lastTelemetryAt != TimePoint{} && snapshot.timestamp < disk->lastTelemetryAt) {
            return;
        }

        disk->lastTelemetryAt = snapshot.timestamp;
        disk->bytesTransferred = std::max(disk->bytesTransferred, snapshot.bytesTransferred);
        if (snapshot.totalBytes > 0) {
            disk->totalBytes = snapshot.totalBytes;
        }
        if (disk->totalBytes > 0) {
            disk->progressPercent = std::min(100.0, 100.0 * static_cast<double>(disk->bytesTransferred) /
                                                        static_cast<double>(disk->totalBytes));
        } else {
            disk->progressPercent = snapshot.progressPercent;
        }
        disk->status = snapshot.status;
        if (snapshot.status == DiskStatus::COMPLETED) {
            disk->changeTrackingId = snapshot.changeId;
            disk->progressPercent = 100.0;
        } else if (snapshot.status == DiskStatus::FAILED) {
            disk->errorMessage = snapshot.errorMessage.empty() ? "capture agent reported failure"
                                                               : snapshot.errorMessage;
        }

        uint64_t bytes = 0;
        uint64_t total = 0;
        for (const auto& d : record.disks) {
            bytes += d.bytesTransferred;
            total += d.totalBytes;
        }
        record.bytesTransferred = bytes;
        record.totalBytes = total;
        if (total > 0) {
            record.progressPercent = std::min(100.0, 100.0 * static_cast<double>(bytes) /
                                                         static_cast<double>(total));
        }
        if (!snapshot.currentPhase.empty()) {
            record.currentPhase = snapshot.currentPhase;
        }
        applied = true;
    });

    if (resumed) {
        Logger::info("Job " + jobId + " reported again and is no longer stalled");
    }
    if (applied) {
        Logger::debug("Telemetry for job " + jobId + " disk " + std::to_string(diskIndex) + ": " +
                      toString(snapshot.status) + " " + std::to_string(snapshot.bytesTransferred) + " bytes");
    } else {
        Logger::debug("Ignored out-of-order telemetry for job " + jobId + " disk " + std::to_string(diskIndex));
    }

    coordinator_->persist(*job);
    coordinator_->evaluateJob(jobId);
    return applied;
}

size_t TelemetryReceiver::receiveJobUpdate(const std::string& jobType, const std::string& jobId,
                                           const TelemetryUpdate& update) {
    if (jobType != "backup") {
        throw BackupError(ErrorKind::INVALID_REQUEST, "unsupported job type: " + jobType, jobId);
    }
    if (!update.jobType.empty() && update.jobType != jobType) {
        throw BackupError(ErrorKind::INVALID_REQUEST, "job_type does not match the request path", jobId);
    }
    if (!update.jobId.empty() && update.jobId != jobId) {
        throw BackupError(ErrorKind::INVALID_REQUEST, "job_id does not match the request path", jobId);
    }

    auto job = coordinator_->findActiveJob(jobId);
    if (!job) {
        jobIsFinished(jobId);
        return 0;
    }

    size_t applied = 0;
    for (const auto& disk : update.disks) {
        TelemetrySnapshot snapshot;
        snapshot.bytesTransferred = disk.bytesTransferred;
        snapshot.totalBytes = disk.totalBytes;
        snapshot.transferSpeedBps = update.transferSpeedBps;
        snapshot.progressPercent = disk.progressPercent;
        snapshot.currentPhase = update.currentPhase;
        snapshot.timestamp = update.timestamp;
        snapshot.status = normalizeStatus(disk.status);
        snapshot.changeId = disk.changeId;
        snapshot.errorMessage = disk.error;
        if (receiveUpdate(jobId, disk.diskIndex, snapshot)) {
            ++applied;
        }
    }

    if (update.disks.empty()) {
        job->modify([&](BackupJobRecord& record) {
            record.lastTelemetryAt = std::chrono::system_clock::now();
            if (record.status == JobStatus::STALLED) {
                record.status = JobStatus::RUNNING;
            }
            if (!update.currentPhase.empty()) {
                record.currentPhase = update.currentPhase;
            }
            if (update.progressPercent > record.progressPercent) {
                record.progressPercent = std::min(100.0, update.progressPercent);
            }
        });
        coordinator_->persist(*job);
    }

    if (!update.errorMessage.empty() || update.status == "failed" || update.status == "error") {
        std::string message = update.errorMessage.empty() ? "capture agent reported job failure"
                                                          : update.errorMessage;
        Logger::error("Capture agent reported failure for job " + jobId + ": " + message);
        coordinator_->failJob(jobId, ErrorKind::CAPTURE_AGENT_ERROR, message);
    }
    return applied;
}

bool TelemetryReceiver::completeDisk(const std::string& jobId, int diskIndex, const std::string& changeId,
                                     uint64_t bytesTransferred) {
    TelemetrySnapshot snapshot;
    snapshot.status = DiskStatus::COMPLETED;
    snapshot.changeId = changeId;
    snapshot.bytesTransferred = bytesTransferred;
    snapshot.timestamp = std::chrono::system_clock::now();
    return receiveUpdate(jobId, diskIndex, snapshot);
}
