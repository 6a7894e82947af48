#pragma once

#include <memory>
#include <string>
#include <vector>
#include "common/backup_status.hpp"
#include "storage/backup_chain.hpp"
#include "storage/catalog_repository.hpp"
#include "storage/image_manager.hpp"

// Linear full + incremental chains per (vm, disk). Chain rows only change
// inside the transaction that inserts the new backup row.
class ChainManager {
public:
    ChainManager(std::shared_ptr<CatalogRepository> repository,
                 std::shared_ptr<ImageManager> images,
                 const std::string& repositoryRoot);

    bool getChain(const std::string& vmIdentifier, int diskIndex, BackupChain& chain);
    bool getLatestBackup(const std::string& vmIdentifier, int diskIndex, BackupRecord& backup);

    // <root>/<vm>/disk<index>/<backupId>.qcow2
    std::string imagePathFor(const std::string& vmIdentifier, int diskIndex,
                             const std::string& backupId) const;

    // Pre-creates the target image. Incrementals need parentImagePath.
    // Throws BackupError(PARENT_BACKUP_MISSING or IMAGE_CREATION_FAILED).
    std::string createImage(const std::string& vmIdentifier, int diskIndex, const std::string& backupId,
                            BackupType type, uint64_t sizeBytes, const std::string& parentImagePath);

    // Throws BackupError(CHAIN_COMMIT_FAILED); nothing is written on failure
    void commitToChain(const BackupRecord& backup);

    // Every backup in one transaction: all chains advance or none do
    void commitAll(const std::vector<BackupRecord>& backups);

    // Walks tail to head checking parent links, image presence and backing files
    bool validateChain(const std::string& vmIdentifier, int diskIndex, std::string& error);

    // Newest first
    std::vector<BackupRecord> listBackups(const std::string& vmIdentifier, int diskIndex);

    // Only the tail has no dependents, so it is the only removable backup
    bool removeLatestBackup(const std::string& vmIdentifier, int diskIndex, std::string& error);

    bool deleteImage(const std::string& path);

    // Writes <image>.json next to the image
    bool writeMetadata(const BackupRecord& backup);
    void setChecksumEnabled(bool enabled) { checksumEnabled_ = enabled; }

    const std::string& getRepositoryRoot() const { return repositoryRoot_; }
    std::shared_ptr<ImageManager> getImageManager() const { return images_; }
    std::shared_ptr<CatalogRepository> getRepository() const { return repository_; }

private:
    void applyCommit(const BackupRecord& backup);

    std::shared_ptr<CatalogRepository> repository_;
    std::shared_ptr<ImageManager> images_;
    std::string repositoryRoot_;
    bool checksumEnabled_;
};
