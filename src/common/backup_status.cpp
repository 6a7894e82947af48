#include "common/backup_status.hpp"

std::string toString(BackupType type) {
    switch (type) {
        case BackupType::FULL:        return "full";
        case BackupType::INCREMENTAL: return "incremental";
    }
    return "unknown";
}

std::string toString(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING:   return "pending";
        case JobStatus::RUNNING:   return "running";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED:    return "failed";
        case JobStatus::STALLED:   return "stalled";
    }
    return "unknown";
}

std::string toString(JobPhase phase) {
    switch (phase) {
        case JobPhase::PENDING:                return "pending";
        case JobPhase::RESOLVING_DISKS:        return "resolving_disks";
        case JobPhase::PROVISIONING_TRANSFERS: return "provisioning_transfers";
        case JobPhase::INVOKING_CAPTURE:       return "invoking_capture";
        case JobPhase::AWAITING_COMPLETION:    return "awaiting_completion";
        case JobPhase::COMMITTING:             return "committing";
        case JobPhase::ROLLING_BACK:           return "rolling_back";
        case JobPhase::COMPLETED:              return "completed";
        case JobPhase::FAILED:                 return "failed";
    }
    return "unknown";
}

std::string toString(DiskStatus status) {
    switch (status) {
        case DiskStatus::PENDING:      return "pending";
        case DiskStatus::PROVISIONED:  return "provisioned";
        case DiskStatus::TRANSFERRING: return "transferring";
        case DiskStatus::COMPLETED:    return "completed";
        case DiskStatus::FAILED:       return "failed";
    }
    return "unknown";
}

std::string toString(TransferState state) {
    switch (state) {
        case TransferState::STARTING: return "starting";
        case TransferState::RUNNING:  return "running";
        case TransferState::STOPPING: return "stopping";
        case TransferState::STOPPED:  return "stopped";
        case TransferState::FAILED:   return "failed";
    }
    return "unknown";
}

bool backupTypeFromString(const std::string& value, BackupType& type) {
    if (value == "full") {
        type = BackupType::FULL;
    } else if (value == "incremental") {
        type = BackupType::INCREMENTAL;
    } else {
        return false;
    }
    return true;
}

bool jobStatusFromString(const std::string& value, JobStatus& status) {
    for (JobStatus candidate : {JobStatus::PENDING, JobStatus::RUNNING, JobStatus::COMPLETED,
                                JobStatus::FAILED, JobStatus::STALLED}) {
        if (toString(candidate) == value) {
            status = candidate;
            return true;
        }
    }
    return false;
}

bool jobPhaseFromString(const std::string& value, JobPhase& phase) {
    for (JobPhase candidate : {JobPhase::PENDING, JobPhase::RESOLVING_DISKS,
                               JobPhase::PROVISIONING_TRANSFERS, JobPhase::INVOKING_CAPTURE,
                               JobPhase::AWAITING_COMPLETION, JobPhase::COMMITTING,
                               JobPhase::ROLLING_BACK, JobPhase::COMPLETED, JobPhase::FAILED}) {
        if (toString(candidate) == value) {
            phase = candidate;
            return true;
        }
    }
    return false;
}

bool diskStatusFromString(const std::string& value, DiskStatus& status) {
    // Capture agents report "transferring" under a few names
    if (value == "running" || value == "in_progress" || value == "replicating") {
        status = DiskStatus::TRANSFERRING;
        return true;
    }
    if (value == "success" || value == "done") {
        status = DiskStatus::COMPLETED;
        return true;
    }
    if (value == "error") {
        status = DiskStatus::FAILED;
        return true;
    }
    for (DiskStatus candidate : {DiskStatus::PENDING, DiskStatus::PROVISIONED,
                                 DiskStatus::TRANSFERRING, DiskStatus::COMPLETED,
                                 DiskStatus::FAILED}) {
        if (toString(candidate) == value) {
            status = candidate;
            return true;
        }
    }
    return false;
}
