#pragma once

#include <memory>
#include <string>
#include <vector>
#include "backup/backup_job.hpp"
#include "storage/backup_chain.hpp"
#include "storage/catalog_database.hpp"

// Row mapping for jobs, disk results, backups and chains. Methods that take
// no Transaction lock the database for their own duration.
class CatalogRepository {
public:
    explicit CatalogRepository(std::shared_ptr<CatalogDatabase> database);

    // Upserts the job row and replaces its disk rows
    void saveJob(const BackupJobRecord& job);
    bool loadJob(const std::string& jobId, BackupJobRecord& job);
    std::vector<BackupJobRecord> listJobs(const std::string& vmIdentifier = "", size_t limit = 100);
    std::vector<BackupJobRecord> listUnfinishedJobs();

    void insertBackup(const BackupRecord& backup);
    bool getBackup(const std::string& backupId, BackupRecord& backup);
    void deleteBackup(const std::string& backupId);
    int countChildren(const std::string& backupId);

    bool getChain(const std::string& vmIdentifier, int diskIndex, BackupChain& chain);
    void upsertChain(const BackupChain& chain);
    void deleteChain(const std::string& vmIdentifier, int diskIndex);
    std::vector<BackupChain> listChains(const std::string& vmIdentifier = "");

    std::shared_ptr<CatalogDatabase> getDatabase() const { return database_; }

private:
    void loadDisks(BackupJobRecord& job);
    static BackupJobRecord readJobRow(const CatalogDatabase::Statement& stmt);
    static BackupRecord readBackupRow(const CatalogDatabase::Statement& stmt);
    static BackupChain readChainRow(const CatalogDatabase::Statement& stmt);

    std::shared_ptr<CatalogDatabase> database_;
};
