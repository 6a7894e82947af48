#include "storage/chain_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace {

bool samePath(const std::string& a, const std::string& b) {
    return std::filesystem::path(a).lexically_normal() == std::filesystem::path(b).lexically_normal();
}

std::string chainName(const std::string& vmIdentifier, int diskIndex) {
    return vmIdentifier + "/disk" + std::to_string(diskIndex);
}

} // namespace

ChainManager::ChainManager(std::shared_ptr<CatalogRepository> repository,
                           std::shared_ptr<ImageManager> images,
                           const std::string& repositoryRoot)
    : repository_(std::move(repository))
    , images_(std::move(images))
    , repositoryRoot_(repositoryRoot)
    , checksumEnabled_(false) {
    if (!repository_ || !images_) {
        throw std::invalid_argument("chain manager requires a repository and an image manager");
    }
}

bool ChainManager::getChain(const std::string& vmIdentifier, int diskIndex, BackupChain& chain) {
    return repository_->getChain(vmIdentifier, diskIndex, chain);
}

bool ChainManager::getLatestBackup(const std::string& vmIdentifier, int diskIndex, BackupRecord& backup) {
    BackupChain chain;
    if (!repository_->getChain(vmIdentifier, diskIndex, chain)) {
        return false;
    }
    return repository_->getBackup(chain.latestBackupId, backup);
}

std::string ChainManager::imagePathFor(const std::string& vmIdentifier, int diskIndex,
                                       const std::string& backupId) const {
    std::filesystem::path path = std::filesystem::path(repositoryRoot_) /
                                 utils::sanitizePathComponent(vmIdentifier) /
                                 ("disk" + std::to_string(diskIndex)) /
                                 (utils::sanitizePathComponent(backupId) + ".qcow2");
    return path.string();
}

std::string ChainManager::createImage(const std::string& vmIdentifier, int diskIndex,
                                      const std::string& backupId, BackupType type,
                                      uint64_t sizeBytes, const std::string& parentImagePath) {
    std::string path = imagePathFor(vmIdentifier, diskIndex, backupId);
    std::string error;

    if (type == BackupType::FULL) {
        if (!images_->createFull(path, sizeBytes, error)) {
            throw BackupError(ErrorKind::IMAGE_CREATION_FAILED,
                              "failed to create image for " + chainName(vmIdentifier, diskIndex) + ": " + error);
        }
        return path;
    }

    if (parentImagePath.empty() || !images_->exists(parentImagePath)) {
        throw BackupError(ErrorKind::PARENT_BACKUP_MISSING,
                          "parent image for " + chainName(vmIdentifier, diskIndex) + " is missing: " +
                          (parentImagePath.empty() ? std::string("<none>") : parentImagePath));
    }
    if (!images_->createIncremental(path, parentImagePath, error)) {
        throw BackupError(ErrorKind::IMAGE_CREATION_FAILED,
                          "failed to create incremental image for " + chainName(vmIdentifier, diskIndex) +
                          ": " + error);
    }
    return path;
}

void ChainManager::applyCommit(const BackupRecord& backup) {
    BackupChain chain;
    bool exists = repository_->getChain(backup.vmIdentifier, backup.diskIndex, chain);
    TimePoint now = std::chrono::system_clock::now();

    if (backup.backupType == BackupType::INCREMENTAL) {
        if (!exists) {
            throw BackupError(ErrorKind::CHAIN_COMMIT_FAILED,
                              "no chain to extend for " + chainName(backup.vmIdentifier, backup.diskIndex));
        }
        if (backup.parentBackupId != chain.latestBackupId) {
            throw BackupError(ErrorKind::CHAIN_COMMIT_FAILED,
                              "parent " + backup.parentBackupId + " is not the tail " + chain.latestBackupId +
                              " of " + chainName(backup.vmIdentifier, backup.diskIndex));
        }
    }

    repository_->insertBackup(backup);

    if (backup.backupType == BackupType::FULL) {
        // A full backup starts a new generation; older images stay on disk untouched
        BackupChain next;
        next.vmIdentifier = backup.vmIdentifier;
        next.diskIndex = backup.diskIndex;
        next.fullBackupId = backup.backupId;
        next.latestBackupId = backup.backupId;
        next.totalBackups = 1;
        next.totalSizeBytes = backup.sizeBytes;
        next.createdAt = now;
        next.updatedAt = now;
        repository_->upsertChain(next);
    } else {
        chain.latestBackupId = backup.backupId;
        chain.totalBackups += 1;
        chain.totalSizeBytes += backup.sizeBytes;
        chain.updatedAt = now;
        repository_->upsertChain(chain);
    }
}

void ChainManager::commitToChain(const BackupRecord& backup) {
    commitAll({backup});
}

void ChainManager::commitAll(const std::vector<BackupRecord>& backups) {
    try {
        CatalogDatabase::Transaction txn(*repository_->getDatabase());
        for (const auto& backup : backups) {
            applyCommit(backup);
        }
        txn.commit();
    } catch (const BackupError& e) {
        Logger::error(std::string("Chain commit rolled back: ") + e.what());
        throw;
    } catch (const std::exception& e) {
        Logger::error(std::string("Chain commit rolled back: ") + e.what());
        throw BackupError(ErrorKind::CHAIN_COMMIT_FAILED, std::string("catalog error: ") + e.what());
    }

    for (const auto& backup : backups) {
        Logger::info("Committed " + toString(backup.backupType) + " backup " + backup.backupId +
                     " to chain " + chainName(backup.vmIdentifier, backup.diskIndex));
    }
}

bool ChainManager::validateChain(const std::string& vmIdentifier, int diskIndex, std::string& error) {
    BackupChain chain;
    if (!repository_->getChain(vmIdentifier, diskIndex, chain)) {
        error = "no backup chain for " + chainName(vmIdentifier, diskIndex);
        return false;
    }

    std::set<std::string> visited;
    std::string currentId = chain.latestBackupId;
    int hops = 0;
    bool reachedFull = false;

    while (!currentId.empty()) {
        if (!visited.insert(currentId).second) {
            error = "cycle at backup " + currentId;
            return false;
        }

        BackupRecord backup;
        if (!repository_->getBackup(currentId, backup)) {
            error = "backup " + currentId + " referenced by the chain is not in the catalog";
            return false;
        }
        if (backup.vmIdentifier != vmIdentifier || backup.diskIndex != diskIndex) {
            error = "backup " + currentId + " belongs to " + chainName(backup.vmIdentifier, backup.diskIndex);
            return false;
        }
        if (!images_->exists(backup.imagePath)) {
            error = "image for backup " + currentId + " is missing: " + backup.imagePath;
            return false;
        }

        ImageInfo info;
        std::string infoError;
        if (!images_->getInfo(backup.imagePath, info, infoError)) {
            error = "cannot inspect image " + backup.imagePath + ": " + infoError;
            return false;
        }
        ++hops;

        if (backup.backupType == BackupType::FULL) {
            if (currentId != chain.fullBackupId) {
                error = "chain head is " + chain.fullBackupId + " but walk ended at full backup " + currentId;
                return false;
            }
            if (!info.backingFile.empty()) {
                error = "full backup image " + backup.imagePath + " has a backing file";
                return false;
            }
            reachedFull = true;
            break;
        }

        BackupRecord parent;
        if (backup.parentBackupId.empty() || !repository_->getBackup(backup.parentBackupId, parent)) {
            error = "parent of incremental backup " + currentId + " is missing";
            return false;
        }
        if (!samePath(info.backingFile, parent.imagePath)) {
            error = "image " + backup.imagePath + " is backed by '" + info.backingFile +
                    "' instead of " + parent.imagePath;
            return false;
        }
        currentId = backup.parentBackupId;
    }

    if (!reachedFull) {
        error = "chain " + chainName(vmIdentifier, diskIndex) + " does not reach a full backup";
        return false;
    }
    if (hops != chain.totalBackups) {
        error = "chain records " + std::to_string(chain.totalBackups) + " backups but " +
                std::to_string(hops) + " are linked";
        return false;
    }
    return true;
}

std::vector<BackupRecord> ChainManager::listBackups(const std::string& vmIdentifier, int diskIndex) {
    std::vector<BackupRecord> backups;
    BackupChain chain;
    if (!repository_->getChain(vmIdentifier, diskIndex, chain)) {
        return backups;
    }

    std::set<std::string> visited;
    std::string currentId = chain.latestBackupId;
    while (!currentId.empty() && visited.insert(currentId).second) {
        BackupRecord backup;
        if (!repository_->getBackup(currentId, backup)) {
            Logger::warning("Chain " + chainName(vmIdentifier, diskIndex) + " references missing backup " + currentId);
            break;
        }
        backups.push_back(backup);
        if (backup.backupType == BackupType::FULL) {
            break;
        }
        currentId = backup.parentBackupId;
    }
    return backups;
}

bool ChainManager::removeLatestBackup(const std::string& vmIdentifier, int diskIndex, std::string& error) {
    BackupRecord latest;
    try {
        CatalogDatabase::Transaction txn(*repository_->getDatabase());

        BackupChain chain;
        if (!repository_->getChain(vmIdentifier, diskIndex, chain)) {
            error = "no backup chain for " + chainName(vmIdentifier, diskIndex);
            return false;
        }
        if (!repository_->getBackup(chain.latestBackupId, latest)) {
            error = "latest backup " + chain.latestBackupId + " is not in the catalog";
            return false;
        }
        if (repository_->countChildren(latest.backupId) > 0) {
            error = "backup " + latest.backupId + " still has dependents";
            return false;
        }

        repository_->deleteBackup(latest.backupId);
        if (chain.totalBackups <= 1 || latest.backupType == BackupType::FULL) {
            repository_->deleteChain(vmIdentifier, diskIndex);
        } else {
            chain.latestBackupId = latest.parentBackupId;
            chain.totalBackups -= 1;
            chain.totalSizeBytes = chain.totalSizeBytes > latest.sizeBytes ?
                                   chain.totalSizeBytes - latest.sizeBytes : 0;
            chain.updatedAt = std::chrono::system_clock::now();
            repository_->upsertChain(chain);
        }
        txn.commit();
    } catch (const std::exception& e) {
        error = std::string("catalog error: ") + e.what();
        Logger::error("Failed to remove latest backup of " + chainName(vmIdentifier, diskIndex) + ": " + error);
        return false;
    }

    deleteImage(latest.imagePath);
    Logger::info("Removed backup " + latest.backupId + " from chain " + chainName(vmIdentifier, diskIndex));
    return true;
}

bool ChainManager::deleteImage(const std::string& path) {
    if (path.empty() || !images_->exists(path)) {
        return true;
    }

    std::string error;
    if (!images_->remove(path, error)) {
        Logger::error("Failed to delete image " + path + ": " + error);
        return false;
    }
    Logger::info("Deleted image " + path);
    return true;
}

bool ChainManager::writeMetadata(const BackupRecord& backup) {
    json metadata = backup.toJson();

    ImageInfo info;
    std::string error;
    if (images_->getInfo(backup.imagePath, info, error)) {
        metadata["image"] = {
            {"format", info.format},
            {"virtual_size", info.virtualSize},
            {"actual_size", info.actualSize},
            {"backing_file", info.backingFile}
        };
    } else {
        Logger::warning("No image info for metadata of " + backup.imagePath + ": " + error);
    }

    if (checksumEnabled_) {
        std::string digest;
        if (utils::sha256File(backup.imagePath, digest, error)) {
            metadata["sha256"] = digest;
        } else {
            Logger::warning("Checksum of " + backup.imagePath + " failed: " + error);
        }
    }

    std::string metadataFile = backup.imagePath + ".json";
    std::ofstream file(metadataFile);
    if (!file.is_open()) {
        Logger::error("Failed to open metadata file for writing: " + metadataFile);
        return false;
    }
    file << metadata.dump(4);
    return static_cast<bool>(file);
}
