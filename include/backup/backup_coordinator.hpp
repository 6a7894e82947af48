#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "backup/backup_job.hpp"
#include "backup/capture_agent_client.hpp"
#include "backup/vm_inventory.hpp"
#include "common/parallel_task_manager.hpp"
#include "storage/catalog_repository.hpp"
#include "storage/chain_manager.hpp"
#include "transfer/port_allocator.hpp"
#include "transfer/transfer_process_manager.hpp"

struct CoordinatorOptions {
    std::string advertiseHost{"127.0.0.1"};
    int sharedReaders{10};
    bool verifyImages{false};
    std::string telemetryUrl;  // base URL the agent reports to; job path is appended
};

// Drives a VM-level backup from disk resolution to commit or rollback.
// Every disk of a job comes from one capture call, and a job either commits
// all of its images or deletes all of them.
class BackupCoordinator {
public:
    BackupCoordinator(std::shared_ptr<PortAllocator> ports,
                      std::shared_ptr<TransferProcessManager> transfers,
                      std::shared_ptr<ChainManager> chains,
                      std::shared_ptr<CatalogRepository> repository,
                      std::shared_ptr<VmInventory> inventory,
                      std::shared_ptr<CaptureAgent> captureAgent,
                      std::shared_ptr<ParallelTaskManager> taskManager,
                      CoordinatorOptions options = CoordinatorOptions());

    BackupCoordinator(const BackupCoordinator&) = delete;
    BackupCoordinator& operator=(const BackupCoordinator&) = delete;

    // Returns once the capture agent has accepted the job. Throws BackupError;
    // by then the failed job is persisted and every resource is released.
    BackupJobRecord startBackup(const std::string& vmIdentifier, BackupType type);

    bool getJob(const std::string& jobId, BackupJobRecord& job);
    std::vector<BackupJobRecord> listJobs(const std::string& vmIdentifier = "", size_t limit = 100);

    // Throws BackupError(NOT_FOUND or INVALID_REQUEST for finished jobs)
    BackupJobRecord cancelBackup(const std::string& jobId);

    std::shared_ptr<BackupJob> findActiveJob(const std::string& jobId) const;
    std::vector<std::shared_ptr<BackupJob>> getActiveJobs() const;
    bool isActive(const std::string& jobId) const;
    // Id of the VM's running job, or empty
    std::string activeJobForVm(const std::string& vmIdentifier) const;

    // Finalizes the job when every disk is terminal; no-op otherwise
    void evaluateJob(const std::string& jobId);

    // Fails and rolls back an active job; false when it was not active
    bool failJob(const std::string& jobId, ErrorKind kind, const std::string& message);

    void onTransferFailure(const TransferProcess& process);

    void persist(const BackupJob& job);

    // Start-up: fails jobs left unfinished by a previous run and removes their images
    size_t recoverInterruptedJobs();

    // Releases leases and stops processes whose owner is no longer an active job
    size_t reconcileResources();

private:
    struct PlannedDisk {
        DiskInfo disk;
        std::string parentBackupId;
        std::string parentImagePath;
        std::string changeTrackingToken;
    };

    std::vector<PlannedDisk> planDisks(BackupJob& job, const std::vector<DiskInfo>& disks);
    void provisionDisks(const std::shared_ptr<BackupJob>& job, const std::vector<PlannedDisk>& plan);
    DiskResult provisionDisk(const std::string& jobId, const std::string& vmIdentifier,
                             BackupType type, const DiskResult& disk, const std::string& parentImagePath);
    CaptureRequest buildCaptureRequest(const BackupJobRecord& record,
                                       const std::vector<PlannedDisk>& plan) const;
    void checkCancelled(const BackupJob& job) const;

    void finalize(const std::shared_ptr<BackupJob>& job, bool success, ErrorKind kind,
                  const std::string& message);
    void releaseResources(const std::string& jobId);
    bool commitImages(const BackupJobRecord& record, std::string& error);
    void rollbackImages(const BackupJobRecord& record);
    void registerJob(const std::shared_ptr<BackupJob>& job);
    void unregisterJob(const std::string& jobId);

    std::shared_ptr<PortAllocator> ports_;
    std::shared_ptr<TransferProcessManager> transfers_;
    std::shared_ptr<ChainManager> chains_;
    std::shared_ptr<CatalogRepository> repository_;
    std::shared_ptr<VmInventory> inventory_;
    std::shared_ptr<CaptureAgent> captureAgent_;
    std::shared_ptr<ParallelTaskManager> taskManager_;
    CoordinatorOptions options_;

    std::map<std::string, std::shared_ptr<BackupJob>> activeJobs_;
    mutable std::mutex jobsMutex_;
};
