#include "storage/catalog_repository.hpp"
#include "common/logger.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {

const char* JOB_COLUMNS =
    "job_id, vm_identifier, backup_type, status, phase, created_at, started_at, completed_at, "
    "error_message, error_kind, snapshot_id, target_descriptor, bytes_transferred, total_bytes, "
    "progress_percent, current_phase, last_telemetry_at";

const char* BACKUP_COLUMNS =
    "backup_id, job_id, vm_identifier, disk_index, backup_type, parent_backup_id, image_path, "
    "size_bytes, change_tracking_id, snapshot_id, created_at";

const char* CHAIN_COLUMNS =
    "vm_identifier, disk_index, full_backup_id, latest_backup_id, total_backups, total_size_bytes, "
    "created_at, updated_at";

int64_t millisOrZero(TimePoint time) {
    return time == TimePoint{} ? 0 : utils::toMillis(time);
}

TimePoint timeColumn(const CatalogDatabase::Statement& stmt, int column) {
    if (stmt.isNull(column) || stmt.columnInt64(column) == 0) {
        return TimePoint{};
    }
    return utils::fromMillis(stmt.columnInt64(column));
}

} // namespace

json BackupRecord::toJson() const {
    return {
        {"backup_id", backupId},
        {"job_id", jobId},
        {"vm_identifier", vmIdentifier},
        {"disk_index", diskIndex},
        {"backup_type", toString(backupType)},
        {"parent_backup_id", parentBackupId},
        {"image_path", imagePath},
        {"size_bytes", sizeBytes},
        {"change_tracking_id", changeTrackingId},
        {"snapshot_id", snapshotId},
        {"created_at", utils::formatTimestamp(createdAt)}
    };
}

json BackupChain::toJson() const {
    return {
        {"vm_identifier", vmIdentifier},
        {"disk_index", diskIndex},
        {"full_backup_id", fullBackupId},
        {"latest_backup_id", latestBackupId},
        {"total_backups", totalBackups},
        {"total_size_bytes", totalSizeBytes},
        {"created_at", utils::formatTimestamp(createdAt)},
        {"updated_at", utils::formatTimestamp(updatedAt)}
    };
}

CatalogRepository::CatalogRepository(std::shared_ptr<CatalogDatabase> database)
    : database_(std::move(database)) {
    if (!database_) {
        throw std::invalid_argument("catalog repository requires a database");
    }
}

void CatalogRepository::saveJob(const BackupJobRecord& job) {
    auto lock = database_->lock();

    auto upsert = database_->prepare(
        std::string("INSERT OR REPLACE INTO backup_jobs (") + JOB_COLUMNS +
        ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17)");
    upsert.bind(1, job.jobId)
          .bind(2, job.vmIdentifier)
          .bind(3, toString(job.backupType))
          .bind(4, toString(job.status))
          .bind(5, toString(job.phase))
          .bind(6, millisOrZero(job.createdAt))
          .bind(7, millisOrZero(job.startedAt))
          .bind(8, millisOrZero(job.completedAt))
          .bind(9, job.errorMessage)
          .bind(10, errorKindToString(job.errorKind))
          .bind(11, job.snapshotId)
          .bind(12, job.targetDescriptor)
          .bind(13, static_cast<int64_t>(job.bytesTransferred))
          .bind(14, static_cast<int64_t>(job.totalBytes))
          .bind(15, job.progressPercent)
          .bind(16, job.currentPhase)
          .bind(17, millisOrZero(job.lastTelemetryAt));

    auto clearDisks = database_->prepare("DELETE FROM disk_results WHERE job_id = ?1");
    clearDisks.bind(1, job.jobId);

    auto insertDisk = database_->prepare(
        "INSERT INTO disk_results (job_id, disk_index, disk_key, source_path, capacity_bytes, port, "
        "export_name, image_path, process_pid, bytes_transferred, total_bytes, progress_percent, status, "
        "change_tracking_id, previous_change_tracking_id, parent_backup_id, backup_id, error_message, "
        "last_telemetry_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, "
        "?16, ?17, ?18, ?19)");

    // Joins the caller's transaction when there is one
    std::unique_ptr<CatalogDatabase::Transaction> txn;
    if (!database_->inTransaction()) {
        txn.reset(new CatalogDatabase::Transaction(*database_));
    }

    upsert.execute();
    clearDisks.execute();
    for (const auto& disk : job.disks) {
        insertDisk.reset();
        insertDisk.bind(1, job.jobId)
                  .bind(2, disk.diskIndex)
                  .bind(3, disk.diskKey)
                  .bind(4, disk.sourcePath)
                  .bind(5, static_cast<int64_t>(disk.capacityBytes))
                  .bind(6, disk.port)
                  .bind(7, disk.exportName)
                  .bind(8, disk.imagePath)
                  .bind(9, disk.qemuProcessPid)
                  .bind(10, static_cast<int64_t>(disk.bytesTransferred))
                  .bind(11, static_cast<int64_t>(disk.totalBytes))
                  .bind(12, disk.progressPercent)
                  .bind(13, toString(disk.status))
                  .bind(14, disk.changeTrackingId)
                  .bind(15, disk.previousChangeTrackingId)
                  .bind(16, disk.parentBackupId)
                  .bind(17, disk.backupId)
                  .bind(18, disk.errorMessage)
                  .bind(19, millisOrZero(disk.lastTelemetryAt));
        insertDisk.execute();
    }

    if (txn) {
        txn->commit();
    }
}

BackupJobRecord CatalogRepository::readJobRow(const CatalogDatabase::Statement& stmt) {
    BackupJobRecord job;
    job.jobId = stmt.columnText(0);
    job.vmIdentifier = stmt.columnText(1);
    backupTypeFromString(stmt.columnText(2), job.backupType);
    jobStatusFromString(stmt.columnText(3), job.status);
    jobPhaseFromString(stmt.columnText(4), job.phase);
    job.createdAt = timeColumn(stmt, 5);
    job.startedAt = timeColumn(stmt, 6);
    job.completedAt = timeColumn(stmt, 7);
    job.errorMessage = stmt.columnText(8);
    job.errorKind = errorKindFromString(stmt.columnText(9));
    job.snapshotId = stmt.columnText(10);
    job.targetDescriptor = stmt.columnText(11);
    job.bytesTransferred = static_cast<uint64_t>(stmt.columnInt64(12));
    job.totalBytes = static_cast<uint64_t>(stmt.columnInt64(13));
    job.progressPercent = stmt.columnDouble(14);
    job.currentPhase = stmt.columnText(15);
    job.lastTelemetryAt = timeColumn(stmt, 16);
    return job;
}

void CatalogRepository::loadDisks(BackupJobRecord& job) {
    auto stmt = database_->prepare(
        "SELECT disk_index, disk_key, source_path, capacity_bytes, port, export_name, image_path, "
        "process_pid, bytes_transferred, total_bytes, progress_percent, status, change_tracking_id, "
        "previous_change_tracking_id, parent_backup_id, backup_id, error_message, last_telemetry_at "
        "FROM disk_results WHERE job_id = ?1 ORDER BY disk_index");
    stmt.bind(1, job.jobId);

    job.disks.clear();
    while (stmt.step()) {
        DiskResult disk;
        disk.diskIndex = stmt.columnInt(0);
        disk.diskKey = stmt.columnText(1);
        disk.sourcePath = stmt.columnText(2);
        disk.capacityBytes = static_cast<uint64_t>(stmt.columnInt64(3));
        disk.port = stmt.columnInt(4);
        disk.exportName = stmt.columnText(5);
        disk.imagePath = stmt.columnText(6);
        disk.qemuProcessPid = stmt.columnInt(7);
        disk.bytesTransferred = static_cast<uint64_t>(stmt.columnInt64(8));
        disk.totalBytes = static_cast<uint64_t>(stmt.columnInt64(9));
        disk.progressPercent = stmt.columnDouble(10);
        diskStatusFromString(stmt.columnText(11), disk.status);
        disk.changeTrackingId = stmt.columnText(12);
        disk.previousChangeTrackingId = stmt.columnText(13);
        disk.parentBackupId = stmt.columnText(14);
        disk.backupId = stmt.columnText(15);
        disk.errorMessage = stmt.columnText(16);
        disk.lastTelemetryAt = timeColumn(stmt, 17);
        job.disks.push_back(disk);
    }
}

bool CatalogRepository::loadJob(const std::string& jobId, BackupJobRecord& job) {
    auto lock = database_->lock();
    auto stmt = database_->prepare(std::string("SELECT ") + JOB_COLUMNS +
                                   " FROM backup_jobs WHERE job_id = ?1");
    stmt.bind(1, jobId);
    if (!stmt.step()) {
        return false;
    }
    job = readJobRow(stmt);
    loadDisks(job);
    return true;
}

std::vector<BackupJobRecord> CatalogRepository::listJobs(const std::string& vmIdentifier, size_t limit) {
    auto lock = database_->lock();
    std::string sql = std::string("SELECT ") + JOB_COLUMNS + " FROM backup_jobs";
    if (!vmIdentifier.empty()) {
        sql += " WHERE vm_identifier = ?1";
    }
    sql += " ORDER BY created_at DESC LIMIT " + std::to_string(limit);

    auto stmt = database_->prepare(sql);
    if (!vmIdentifier.empty()) {
        stmt.bind(1, vmIdentifier);
    }

    std::vector<BackupJobRecord> jobs;
    while (stmt.step()) {
        jobs.push_back(readJobRow(stmt));
    }
    for (auto& job : jobs) {
        loadDisks(job);
    }
    return jobs;
}

std::vector<BackupJobRecord> CatalogRepository::listUnfinishedJobs() {
    auto lock = database_->lock();
    auto stmt = database_->prepare(std::string("SELECT ") + JOB_COLUMNS +
                                   " FROM backup_jobs WHERE status NOT IN ('completed', 'failed')"
                                   " ORDER BY created_at");
    std::vector<BackupJobRecord> jobs;
    while (stmt.step()) {
        jobs.push_back(readJobRow(stmt));
    }
    for (auto& job : jobs) {
        loadDisks(job);
    }
    return jobs;
}

void CatalogRepository::insertBackup(const BackupRecord& backup) {
    auto lock = database_->lock();
    auto stmt = database_->prepare(std::string("INSERT INTO backups (") + BACKUP_COLUMNS +
                                   ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)");
    stmt.bind(1, backup.backupId)
        .bind(2, backup.jobId)
        .bind(3, backup.vmIdentifier)
        .bind(4, backup.diskIndex)
        .bind(5, toString(backup.backupType));
    if (backup.parentBackupId.empty()) {
        stmt.bindNull(6);
    } else {
        stmt.bind(6, backup.parentBackupId);
    }
    stmt.bind(7, backup.imagePath)
        .bind(8, static_cast<int64_t>(backup.sizeBytes))
        .bind(9, backup.changeTrackingId)
        .bind(10, backup.snapshotId)
        .bind(11, millisOrZero(backup.createdAt));
    stmt.execute();
}

BackupRecord CatalogRepository::readBackupRow(const CatalogDatabase::Statement& stmt) {
    BackupRecord backup;
    backup.backupId = stmt.columnText(0);
    backup.jobId = stmt.columnText(1);
    backup.vmIdentifier = stmt.columnText(2);
    backup.diskIndex = stmt.columnInt(3);
    backupTypeFromString(stmt.columnText(4), backup.backupType);
    backup.parentBackupId = stmt.columnText(5);
    backup.imagePath = stmt.columnText(6);
    backup.sizeBytes = static_cast<uint64_t>(stmt.columnInt64(7));
    backup.changeTrackingId = stmt.columnText(8);
    backup.snapshotId = stmt.columnText(9);
    backup.createdAt = timeColumn(stmt, 10);
    return backup;
}

bool CatalogRepository::getBackup(const std::string& backupId, BackupRecord& backup) {
    auto lock = database_->lock();
    auto stmt = database_->prepare(std::string("SELECT ") + BACKUP_COLUMNS +
                                   " FROM backups WHERE backup_id = ?1");
    stmt.bind(1, backupId);
    if (!stmt.step()) {
        return false;
    }
    backup = readBackupRow(stmt);
    return true;
}

void CatalogRepository::deleteBackup(const std::string& backupId) {
    auto lock = database_->lock();
    auto stmt = database_->prepare("DELETE FROM backups WHERE backup_id = ?1");
    stmt.bind(1, backupId);
    stmt.execute();
}

int CatalogRepository::countChildren(const std::string& backupId) {
    auto lock = database_->lock();
    auto stmt = database_->prepare("SELECT COUNT(*) FROM backups WHERE parent_backup_id = ?1");
    stmt.bind(1, backupId);
    return stmt.step() ? stmt.columnInt(0) : 0;
}

BackupChain CatalogRepository::readChainRow(const CatalogDatabase::Statement& stmt) {
    BackupChain chain;
    chain.vmIdentifier = stmt.columnText(0);
    chain.diskIndex = stmt.columnInt(1);
    chain.fullBackupId = stmt.columnText(2);
    chain.latestBackupId = stmt.columnText(3);
    chain.totalBackups = stmt.columnInt(4);
    chain.totalSizeBytes = static_cast<uint64_t>(stmt.columnInt64(5));
    chain.createdAt = timeColumn(stmt, 6);
    chain.updatedAt = timeColumn(stmt, 7);
    return chain;
}

bool CatalogRepository::getChain(const std::string& vmIdentifier, int diskIndex, BackupChain& chain) {
    auto lock = database_->lock();
    auto stmt = database_->prepare(std::string("SELECT ") + CHAIN_COLUMNS +
                                   " FROM backup_chains WHERE vm_identifier = ?1 AND disk_index = ?2");
    stmt.bind(1, vmIdentifier).bind(2, diskIndex);
    if (!stmt.step()) {
        return false;
    }
    chain = readChainRow(stmt);
    return true;
}

void CatalogRepository::upsertChain(const BackupChain& chain) {
    auto lock = database_->lock();
    auto stmt = database_->prepare(std::string("INSERT OR REPLACE INTO backup_chains (") + CHAIN_COLUMNS +
                                   ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
    stmt.bind(1, chain.vmIdentifier)
        .bind(2, chain.diskIndex)
        .bind(3, chain.fullBackupId)
        .bind(4, chain.latestBackupId)
        .bind(5, chain.totalBackups)
        .bind(6, static_cast<int64_t>(chain.totalSizeBytes))
        .bind(7, millisOrZero(chain.createdAt))
        .bind(8, millisOrZero(chain.updatedAt));
    stmt.execute();
}

void CatalogRepository::deleteChain(const std::string& vmIdentifier, int diskIndex) {
    auto lock = database_->lock();
    auto stmt = database_->prepare("DELETE FROM backup_chains WHERE vm_identifier = ?1 AND disk_index = ?2");
    stmt.bind(1, vmIdentifier).bind(2, diskIndex);
    stmt.execute();
}

std::vector<BackupChain> CatalogRepository::listChains(const std::string& vmIdentifier) {
    auto lock = database_->lock();
    std::string sql = std::string("SELECT ") + CHAIN_COLUMNS + " FROM backup_chains";
    if (!vmIdentifier.empty()) {
        sql += " WHERE vm_identifier = ?1";
    }
    sql += " ORDER BY vm_identifier, disk_index";

    auto stmt = database_->prepare(sql);
    if (!vmIdentifier.empty()) {
        stmt.bind(1, vmIdentifier);
    }
    std::vector<BackupChain> chains;
    while (stmt.step()) {
        chains.push_back(readChainRow(stmt));
    }
    return chains;
}
