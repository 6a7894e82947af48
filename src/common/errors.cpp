#include "common/errors.hpp"

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                          return "";
        case ErrorKind::POOL_EXHAUSTED:                return "PoolExhausted";
        case ErrorKind::TRANSFER_PROCESS_START_FAILED: return "TransferProcessStartFailed";
        case ErrorKind::TRANSFER_PROCESS_FAILED:       return "TransferProcessFailed";
        case ErrorKind::PARENT_BACKUP_MISSING:         return "ParentBackupMissing";
        case ErrorKind::CHAIN_COMMIT_FAILED:           return "ChainCommitFailed";
        case ErrorKind::CAPTURE_AGENT_UNREACHABLE:     return "CaptureAgentUnreachable";
        case ErrorKind::CAPTURE_AGENT_ERROR:           return "CaptureAgentError";
        case ErrorKind::STALE_JOB:                     return "StaleJob";
        case ErrorKind::DISK_RESOLUTION_FAILED:        return "DiskResolutionFailed";
        case ErrorKind::IMAGE_CREATION_FAILED:         return "ImageCreationFailed";
        case ErrorKind::DISK_TRANSFER_FAILED:          return "DiskTransferFailed";
        case ErrorKind::BACKUP_IN_PROGRESS:            return "BackupInProgress";
        case ErrorKind::CANCELLED:                     return "Cancelled";
        case ErrorKind::INVALID_REQUEST:               return "InvalidRequest";
        case ErrorKind::NOT_FOUND:                     return "NotFound";
        case ErrorKind::INTERNAL:                      return "Internal";
    }
    return "Internal";
}

ErrorKind errorKindFromString(const std::string& value) {
    if (value.empty()) {
        return ErrorKind::NONE;
    }
    for (int i = static_cast<int>(ErrorKind::POOL_EXHAUSTED);
         i <= static_cast<int>(ErrorKind::INTERNAL); ++i) {
        ErrorKind kind = static_cast<ErrorKind>(i);
        if (errorKindToString(kind) == value) {
            return kind;
        }
    }
    return ErrorKind::INTERNAL;
}

BackupError::BackupError(ErrorKind kind, const std::string& message, const std::string& jobId)
    : std::runtime_error(message)
    , kind_(kind)
    , jobId_(jobId) {
}
