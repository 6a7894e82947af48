#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "common/backup_status.hpp"
#include "common/utils.hpp"

// One committed image in a chain
struct BackupRecord {
    std::string backupId;
    std::string jobId;
    std::string vmIdentifier;
    int diskIndex{0};
    BackupType backupType{BackupType::FULL};
    std::string parentBackupId;
    std::string imagePath;
    uint64_t sizeBytes{0};
    std::string changeTrackingId;
    std::string snapshotId;
    TimePoint createdAt{};

    nlohmann::json toJson() const;
};

// Head and tail of the linear chain for one (vm, disk)
struct BackupChain {
    std::string vmIdentifier;
    int diskIndex{0};
    std::string fullBackupId;
    std::string latestBackupId;
    int totalBackups{0};
    uint64_t totalSizeBytes{0};
    TimePoint createdAt{};
    TimePoint updatedAt{};

    nlohmann::json toJson() const;
};
