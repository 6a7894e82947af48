#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    NONE,
    POOL_EXHAUSTED,
    TRANSFER_PROCESS_START_FAILED,
    TRANSFER_PROCESS_FAILED,
    PARENT_BACKUP_MISSING,
    CHAIN_COMMIT_FAILED,
    CAPTURE_AGENT_UNREACHABLE,
    CAPTURE_AGENT_ERROR,
    STALE_JOB,
    DISK_RESOLUTION_FAILED,
    IMAGE_CREATION_FAILED,
    DISK_TRANSFER_FAILED,
    BACKUP_IN_PROGRESS,
    CANCELLED,
    INVALID_REQUEST,
    NOT_FOUND,
    INTERNAL
};

std::string errorKindToString(ErrorKind kind);
ErrorKind errorKindFromString(const std::string& value);

// Thrown by orchestration operations. The job id is empty when the failure
// happened before a job record existed.
class BackupError : public std::runtime_error {
public:
    BackupError(ErrorKind kind, const std::string& message, const std::string& jobId = "");

    ErrorKind kind() const { return kind_; }
    const std::string& jobId() const { return jobId_; }

private:
    ErrorKind kind_;
    std::string jobId_;
};
