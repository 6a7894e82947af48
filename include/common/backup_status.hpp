#pragma once

#include <string>

enum class BackupType {
    FULL,
    INCREMENTAL
};

// Externally visible job status
enum class JobStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    STALLED
};

// Coordinator state machine position
enum class JobPhase {
    PENDING,
    RESOLVING_DISKS,
    PROVISIONING_TRANSFERS,
    INVOKING_CAPTURE,
    AWAITING_COMPLETION,
    COMMITTING,
    ROLLING_BACK,
    COMPLETED,
    FAILED
};

enum class DiskStatus {
    PENDING,
    PROVISIONED,
    TRANSFERRING,
    COMPLETED,
    FAILED
};

enum class TransferState {
    STARTING,
    RUNNING,
    STOPPING,
    STOPPED,
    FAILED
};

std::string toString(BackupType type);
std::string toString(JobStatus status);
std::string toString(JobPhase phase);
std::string toString(DiskStatus status);
std::string toString(TransferState state);

bool backupTypeFromString(const std::string& value, BackupType& type);
bool jobStatusFromString(const std::string& value, JobStatus& status);
bool jobPhaseFromString(const std::string& value, JobPhase& phase);
bool diskStatusFromString(const std::string& value, DiskStatus& status);

inline bool isTerminal(JobStatus status) {
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED;
}

inline bool isTerminal(DiskStatus status) {
    return status == DiskStatus::COMPLETED || status == DiskStatus::FAILED;
}
