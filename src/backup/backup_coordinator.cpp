#include "backup/backup_coordinator.hpp"
#include "backup/target_descriptor.hpp"
#include "common/logger.hpp"
#include <future>
#include <set>

BackupCoordinator::BackupCoordinator(std::shared_ptr<PortAllocator> ports,
                                     std::shared_ptr<TransferProcessManager> transfers,
                                     std::shared_ptr<ChainManager> chains,
                                     std::shared_ptr<CatalogRepository> repository,
                                     std::shared_ptr<VmInventory> inventory,
                                     std::shared_ptr<CaptureAgent> captureAgent,
                                     std::shared_ptr<ParallelTaskManager> taskManager,
                                     CoordinatorOptions options)
    : ports_(std::move(ports))
    , transfers_(std::move(transfers))
    , chains_(std::move(chains))
    , repository_(std::move(repository))
    , inventory_(std::move(inventory))
    , captureAgent_(std::move(captureAgent))
    , taskManager_(std::move(taskManager))
    , options_(std::move(options)) {
    if (!ports_ || !transfers_ || !chains_ || !repository_ || !inventory_ || !captureAgent_ || !taskManager_) {
        throw std::invalid_argument("backup coordinator is missing a collaborator");
    }
}

BackupJobRecord BackupCoordinator::startBackup(const std::string& vmIdentifier, BackupType type) {
    if (vmIdentifier.empty()) {
        throw BackupError(ErrorKind::INVALID_REQUEST, "vm_identifier is required");
    }

    auto job = std::make_shared<BackupJob>(vmIdentifier, type);
    const std::string jobId = job->getId();
    job->setStatusCallback([](const std::string& id, JobStatus status) {
        Logger::info("Job " + id + " is now " + toString(status));
    });

    registerJob(job);
    Logger::info("Starting " + toString(type) + " backup job " + jobId + " for VM " + vmIdentifier);

    job->modify([](BackupJobRecord& record) {
        record.status = JobStatus::RUNNING;
        record.phase = JobPhase::RESOLVING_DISKS;
    });
    persist(*job);

    try {
        std::vector<DiskInfo> disks;
        std::string error;
        if (!inventory_->resolveDisks(vmIdentifier, disks, error)) {
            throw BackupError(ErrorKind::DISK_RESOLUTION_FAILED, error, jobId);
        }
        if (disks.empty()) {
            throw BackupError(ErrorKind::DISK_RESOLUTION_FAILED, "VM " + vmIdentifier + " has no disks", jobId);
        }

        auto plan = planDisks(*job, disks);
        checkCancelled(*job);

        job->setPhase(JobPhase::PROVISIONING_TRANSFERS);
        persist(*job);
        provisionDisks(job, plan);
        checkCancelled(*job);

        BackupJobRecord record = job->snapshot();
        std::vector<TargetEntry> targets;
        for (const auto& disk : record.disks) {
            targets.push_back(TargetEntry{disk.diskKey, options_.advertiseHost, disk.port, disk.exportName});
        }
        std::string descriptor = buildTargetDescriptor(targets);
        job->modify([&](BackupJobRecord& r) {
            r.targetDescriptor = descriptor;
            r.phase = JobPhase::INVOKING_CAPTURE;
        });
        persist(*job);

        CaptureResponse response = captureAgent_->startCapture(buildCaptureRequest(job->snapshot(), plan));

        job->modify([&](BackupJobRecord& r) {
            r.snapshotId = response.snapshotId;
            r.phase = JobPhase::AWAITING_COMPLETION;
            r.startedAt = std::chrono::system_clock::now();
            for (auto& disk : r.disks) {
                if (disk.status == DiskStatus::PROVISIONED) {
                    disk.status = DiskStatus::TRANSFERRING;
                }
            }
        });
        persist(*job);
    } catch (const BackupError& e) {
        Logger::error("Backup job " + jobId + " failed during setup: " + e.what());
        finalize(job, false, e.kind(), e.what());
        throw BackupError(e.kind(), e.what(), jobId);
    } catch (const std::exception& e) {
        Logger::error("Backup job " + jobId + " failed during setup: " + e.what());
        finalize(job, false, ErrorKind::INTERNAL, e.what());
        throw BackupError(ErrorKind::INTERNAL, e.what(), jobId);
    }

    Logger::info("Backup job " + jobId + " awaiting completion of " +
                 std::to_string(job->snapshot().disks.size()) + " disks");

    // Telemetry may already have finished every disk
    evaluateJob(jobId);
    return job->snapshot();
}

std::vector<BackupCoordinator::PlannedDisk> BackupCoordinator::planDisks(BackupJob& job,
                                                                       const std::vector<DiskInfo>& disks) {
    const std::string jobId = job.getId();
    const std::string vmIdentifier = job.getVmIdentifier();
    const BackupType type = job.getBackupType();

    std::vector<PlannedDisk> plan;
    for (const auto& disk : disks) {
        PlannedDisk planned;
        planned.disk = disk;

        if (type == BackupType::INCREMENTAL) {
            const std::string diskName = "disk " + std::to_string(disk.diskIndex);
            BackupChain chain;
            if (!chains_->getChain(vmIdentifier, disk.diskIndex, chain)) {
                throw BackupError(ErrorKind::PARENT_BACKUP_MISSING,
                                  diskName + " has no backup chain; run a full backup first", jobId);
            }

            std::string error;
            if (!chains_->validateChain(vmIdentifier, disk.diskIndex, error)) {
                throw BackupError(ErrorKind::PARENT_BACKUP_MISSING,
                                  "chain of " + diskName + " is not usable: " + error, jobId);
            }

            BackupRecord latest;
            if (!chains_->getLatestBackup(vmIdentifier, disk.diskIndex, latest)) {
                throw BackupError(ErrorKind::PARENT_BACKUP_MISSING,
                                  "latest backup of " + diskName + " is missing", jobId);
            }
            if (latest.changeTrackingId.empty()) {
                throw BackupError(ErrorKind::PARENT_BACKUP_MISSING,
                                  "latest backup " + latest.backupId + " of " + diskName +
                                  " has no change-tracking token", jobId);
            }

            planned.parentBackupId = latest.backupId;
            planned.parentImagePath = latest.imagePath;
            planned.changeTrackingToken = latest.changeTrackingId;
        }
        plan.push_back(planned);
    }

    job.modify([&](BackupJobRecord& record) {
        record.disks.clear();
        for (const auto& planned : plan) {
            DiskResult result;
            result.diskIndex = planned.disk.diskIndex;
            result.diskKey = planned.disk.diskKey;
            result.sourcePath = planned.disk.sourcePath;
            result.capacityBytes = planned.disk.capacityBytes;
            result.totalBytes = planned.disk.capacityBytes;
            result.exportName = makeExportName(vmIdentifier, planned.disk.diskIndex);
            result.backupId = utils::generateId("bk-");
            result.imagePath = chains_->imagePathFor(vmIdentifier, planned.disk.diskIndex, result.backupId);
            result.parentBackupId = planned.parentBackupId;
            result.previousChangeTrackingId = planned.changeTrackingToken;
            record.disks.push_back(result);
        }
    });
    return plan;
}

void BackupCoordinator::provisionDisks(const std::shared_ptr<BackupJob>& job,
                                       const std::vector<PlannedDisk>& plan) {
    const std::string jobId = job->getId();
    const std::string vmIdentifier = job->getVmIdentifier();
    const BackupType type = job->getBackupType();

    // Ports in disk order so a pool shortfall fails before any image exists
    for (const auto& planned : plan) {
        int port = ports_->allocate(jobId, planned.disk.diskIndex);
        job->modify([&](BackupJobRecord& record) {
            record.findDisk(planned.disk.diskIndex)->port = port;
        });
    }

    BackupJobRecord record = job->snapshot();
    std::vector<std::future<DiskResult>> futures;
    for (size_t i = 0; i < record.disks.size(); ++i) {
        DiskResult disk = record.disks[i];
        std::string parentImagePath = plan[i].parentImagePath;
        futures.push_back(taskManager_->addPriorityTask(TaskPriority::HIGH,
            [this, jobId, vmIdentifier, type, disk, parentImagePath]() {
                return provisionDisk(jobId, vmIdentifier, type, disk, parentImagePath);
            }));
    }

    // Wait for every disk so no process starts after a rollback began
    std::unique_ptr<BackupError> firstError;
    for (auto& future : futures) {
        try {
            DiskResult provisioned = future.get();
            job->modify([&](BackupJobRecord& r) {
                DiskResult* disk = r.findDisk(provisioned.diskIndex);
                disk->imagePath = provisioned.imagePath;
                disk->qemuProcessPid = provisioned.qemuProcessPid;
                // The health sweep may already have failed this disk
                if (!isTerminal(disk->status)) {
                    disk->status = DiskStatus::PROVISIONED;
                }
            });
        } catch (const BackupError& e) {
            Logger::error("Provisioning for job " + jobId + " failed: " + e.what());
            if (!firstError) {
                firstError = std::make_unique<BackupError>(e.kind(), e.what(), jobId);
            }
        } catch (const std::exception& e) {
            Logger::error("Provisioning for job " + jobId + " failed: " + e.what());
            if (!firstError) {
                firstError = std::make_unique<BackupError>(ErrorKind::INTERNAL, e.what(), jobId);
            }
        }
    }

    if (firstError) {
        throw *firstError;
    }

    BackupJobRecord provisioned = job->snapshot();
    if (const DiskResult* failed = provisioned.firstFailedDisk()) {
        throw BackupError(ErrorKind::TRANSFER_PROCESS_FAILED,
                          "transfer server for disk " + std::to_string(failed->diskIndex) +
                          " exited during provisioning: " + failed->errorMessage, jobId);
    }
}

DiskResult BackupCoordinator::provisionDisk(const std::string& jobId, const std::string& vmIdentifier,
                                            BackupType type, const DiskResult& disk,
                                            const std::string& parentImagePath) {
    DiskResult result = disk;
    result.imagePath = chains_->createImage(vmIdentifier, disk.diskIndex, disk.backupId, type,
                                            disk.capacityBytes, parentImagePath);

    TransferProcess process = transfers_->start(disk.port, result.imagePath, disk.exportName,
                                                options_.sharedReaders, jobId, disk.diskIndex);
    result.qemuProcessPid = process.pid;
    result.status = DiskStatus::PROVISIONED;
    return result;
}

CaptureRequest BackupCoordinator::buildCaptureRequest(const BackupJobRecord& record,
                                                      const std::vector<PlannedDisk>& plan) const {
    CaptureRequest request;
    request.jobId = record.jobId;
    request.vmIdentifier = record.vmIdentifier;
    request.backupType = toString(record.backupType);
    request.nbdHost = options_.advertiseHost;
    request.targetDescriptor = record.targetDescriptor;
    if (record.backupType == BackupType::INCREMENTAL) {
        for (const auto& planned : plan) {
            request.changeTrackingTokens[planned.disk.diskKey] = planned.changeTrackingToken;
        }
    }
    if (!options_.telemetryUrl.empty()) {
        request.telemetryUrl = options_.telemetryUrl + "/api/v1/telemetry/backup/" + utils::urlEncode(record.jobId);
    }
    return request;
}

void BackupCoordinator::checkCancelled(const BackupJob& job) const {
    if (job.isCancelRequested()) {
        throw BackupError(ErrorKind::CANCELLED, "cancelled by request", job.getId());
    }
}

bool BackupCoordinator::getJob(const std::string& jobId, BackupJobRecord& job) {
    auto active = findActiveJob(jobId);
    if (active) {
        job = active->snapshot();
        return true;
    }
    return repository_->loadJob(jobId, job);
}

std::vector<BackupJobRecord> BackupCoordinator::listJobs(const std::string& vmIdentifier, size_t limit) {
    auto jobs = repository_->listJobs(vmIdentifier, limit);
    for (auto& job : jobs) {
        auto active = findActiveJob(job.jobId);
        if (active) {
            job = active->snapshot();
        }
    }
    return jobs;
}

BackupJobRecord BackupCoordinator::cancelBackup(const std::string& jobId) {
    auto job = findActiveJob(jobId);
    if (!job) {
        BackupJobRecord record;
        if (repository_->loadJob(jobId, record)) {
            throw BackupError(ErrorKind::INVALID_REQUEST,
                              "job already finished with status " + toString(record.status), jobId);
        }
        throw BackupError(ErrorKind::NOT_FOUND, "unknown job " + jobId, jobId);
    }

    Logger::warning("Cancel requested for backup job " + jobId);
    job->requestCancel();
    if (job->getPhase() == JobPhase::AWAITING_COMPLETION) {
        finalize(job, false, ErrorKind::CANCELLED, "cancelled by request");
    }
    return job->snapshot();
}

std::shared_ptr<BackupJob> BackupCoordinator::findActiveJob(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    auto it = activeJobs_.find(jobId);
    return it == activeJobs_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<BackupJob>> BackupCoordinator::getActiveJobs() const {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    std::vector<std::shared_ptr<BackupJob>> jobs;
    for (const auto& entry : activeJobs_) {
        jobs.push_back(entry.second);
    }
    return jobs;
}

bool BackupCoordinator::isActive(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    return activeJobs_.count(jobId) > 0;
}

std::string BackupCoordinator::activeJobForVm(const std::string& vmIdentifier) const {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    for (const auto& entry : activeJobs_) {
        if (entry.second->getVmIdentifier() == vmIdentifier) {
            return entry.first;
        }
    }
    return "";
}

void BackupCoordinator::evaluateJob(const std::string& jobId) {
    auto job = findActiveJob(jobId);
    if (!job || job->isFinalizing()) {
        return;
    }

    BackupJobRecord record = job->snapshot();
    if (record.phase != JobPhase::AWAITING_COMPLETION) {
        return;
    }

    if (job->isCancelRequested()) {
        finalize(job, false, ErrorKind::CANCELLED, "cancelled by request");
        return;
    }

    const DiskResult* failed = record.firstFailedDisk();
    if (failed) {
        finalize(job, false, ErrorKind::DISK_TRANSFER_FAILED,
                 "disk " + std::to_string(failed->diskIndex) + " failed: " +
                 (failed->errorMessage.empty() ? std::string("no detail reported") : failed->errorMessage));
        return;
    }

    if (record.allDisksCompleted()) {
        finalize(job, true, ErrorKind::NONE, "");
    }
}

bool BackupCoordinator::failJob(const std::string& jobId, ErrorKind kind, const std::string& message) {
    auto job = findActiveJob(jobId);
    if (!job) {
        return false;
    }
    finalize(job, false, kind, message);
    return true;
}

void BackupCoordinator::onTransferFailure(const TransferProcess& process) {
    auto job = findActiveJob(process.ownerJobId);
    if (!job) {
        Logger::warning("Transfer server on port " + std::to_string(process.port) +
                        " failed for inactive job " + process.ownerJobId);
        return;
    }

    bool diskWasOpen = false;
    job->modify([&](BackupJobRecord& record) {
        DiskResult* disk = record.findDisk(process.diskIndex);
        if (disk && !isTerminal(disk->status)) {
            disk->status = DiskStatus::FAILED;
            disk->errorMessage = process.failureReason;
            diskWasOpen = true;
        }
    });

    if (!diskWasOpen) {
        Logger::warning("Transfer server for finished disk " + std::to_string(process.diskIndex) +
                        " of job " + process.ownerJobId + " exited: " + process.failureReason);
        return;
    }

    if (job->getPhase() == JobPhase::AWAITING_COMPLETION) {
        finalize(job, false, ErrorKind::TRANSFER_PROCESS_FAILED,
                 "transfer server for disk " + std::to_string(process.diskIndex) + " failed: " +
                 process.failureReason);
    }
}

void BackupCoordinator::finalize(const std::shared_ptr<BackupJob>& job, bool success, ErrorKind kind,
                                 const std::string& message) {
    if (!job->beginFinalize()) {
        return;
    }

    const std::string jobId = job->getId();
    job->setPhase(success ? JobPhase::COMMITTING : JobPhase::ROLLING_BACK);
    persist(*job);

    releaseResources(jobId);

    if (success) {
        std::string error;
        BackupJobRecord record = job->snapshot();
        if (commitImages(record, error)) {
            job->modify([](BackupJobRecord& r) {
                r.status = JobStatus::COMPLETED;
                r.phase = JobPhase::COMPLETED;
                r.errorKind = ErrorKind::NONE;
                r.errorMessage.clear();
                r.progressPercent = 100.0;
                r.completedAt = std::chrono::system_clock::now();
            });
            Logger::info("Backup job " + jobId + " completed");
        } else {
            Logger::error("Backup job " + jobId + " could not be committed: " + error);
            job->setPhase(JobPhase::ROLLING_BACK);
            rollbackImages(record);
            kind = ErrorKind::CHAIN_COMMIT_FAILED;
            success = false;
            job->modify([&](BackupJobRecord& r) {
                r.status = JobStatus::FAILED;
                r.phase = JobPhase::FAILED;
                r.errorKind = ErrorKind::CHAIN_COMMIT_FAILED;
                r.errorMessage = error;
                r.completedAt = std::chrono::system_clock::now();
            });
        }
    } else {
        rollbackImages(job->snapshot());
        job->modify([&](BackupJobRecord& r) {
            r.status = JobStatus::FAILED;
            r.phase = JobPhase::FAILED;
            r.errorKind = kind;
            r.errorMessage = message;
            r.completedAt = std::chrono::system_clock::now();
            for (auto& disk : r.disks) {
                if (disk.status != DiskStatus::FAILED) {
                    disk.status = DiskStatus::FAILED;
                    if (disk.errorMessage.empty()) {
                        disk.errorMessage = "rolled back";
                    }
                }
            }
        });
        Logger::error("Backup job " + jobId + " failed (" + errorKindToString(kind) + "): " + message);
    }

    persist(*job);
    unregisterJob(jobId);
}

void BackupCoordinator::releaseResources(const std::string& jobId) {
    size_t stopped = transfers_->stopAllForJob(jobId);
    size_t released = ports_->releaseAll(jobId);
    Logger::info("Job " + jobId + ": stopped " + std::to_string(stopped) + " transfer servers, released " +
                 std::to_string(released) + " ports");
}

bool BackupCoordinator::commitImages(const BackupJobRecord& record, std::string& error) {
    auto images = chains_->getImageManager();
    std::vector<BackupRecord> backups;
    TimePoint now = std::chrono::system_clock::now();

    for (const auto& disk : record.disks) {
        if (options_.verifyImages && !images->check(disk.imagePath, error)) {
            error = "image check failed for disk " + std::to_string(disk.diskIndex) + ": " + error;
            return false;
        }

        BackupRecord backup;
        backup.backupId = disk.backupId;
        backup.jobId = record.jobId;
        backup.vmIdentifier = record.vmIdentifier;
        backup.diskIndex = disk.diskIndex;
        backup.backupType = record.backupType;
        backup.parentBackupId = record.backupType == BackupType::INCREMENTAL ? disk.parentBackupId : "";
        backup.imagePath = disk.imagePath;
        backup.changeTrackingId = disk.changeTrackingId;
        backup.snapshotId = record.snapshotId;
        backup.createdAt = now;

        ImageInfo info;
        std::string infoError;
        backup.sizeBytes = images->getInfo(disk.imagePath, info, infoError) ? info.actualSize
                                                                            : disk.bytesTransferred;
        backups.push_back(backup);
    }

    try {
        chains_->commitAll(backups);
    } catch (const BackupError& e) {
        error = e.what();
        return false;
    }

    for (const auto& backup : backups) {
        chains_->writeMetadata(backup);
    }
    return true;
}

void BackupCoordinator::rollbackImages(const BackupJobRecord& record) {
    for (const auto& disk : record.disks) {
        if (!chains_->deleteImage(disk.imagePath)) {
            Logger::error("Rollback of job " + record.jobId + " left image " + disk.imagePath + " behind");
        }
    }
}

void BackupCoordinator::persist(const BackupJob& job) {
    try {
        repository_->saveJob(job.snapshot());
    } catch (const std::exception& e) {
        Logger::error("Failed to persist job " + job.getId() + ": " + e.what());
    }
}

void BackupCoordinator::registerJob(const std::shared_ptr<BackupJob>& job) {
    const std::string vmIdentifier = job->getVmIdentifier();
    std::lock_guard<std::mutex> lock(jobsMutex_);
    for (const auto& entry : activeJobs_) {
        if (entry.second->getVmIdentifier() == vmIdentifier) {
            throw BackupError(ErrorKind::BACKUP_IN_PROGRESS,
                              "backup job " + entry.first + " is already running for VM " + vmIdentifier);
        }
    }
    activeJobs_[job->getId()] = job;
}

void BackupCoordinator::unregisterJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    activeJobs_.erase(jobId);
}

size_t BackupCoordinator::recoverInterruptedJobs() {
    size_t recovered = 0;
    for (auto& record : repository_->listUnfinishedJobs()) {
        if (isActive(record.jobId)) {
            continue;
        }

        // Transfer servers run in their own process group and survive our exit
        for (const auto& disk : record.disks) {
            if (transfers_->stopStrayServer(disk.qemuProcessPid, disk.port)) {
                Logger::info("Stopped transfer server of interrupted job " + record.jobId + " disk " +
                             std::to_string(disk.diskIndex));
            }
        }

        bool committed = !record.disks.empty();
        for (const auto& disk : record.disks) {
            BackupRecord backup;
            if (disk.backupId.empty() || !repository_->getBackup(disk.backupId, backup)) {
                committed = false;
            }
        }

        record.completedAt = std::chrono::system_clock::now();
        if (committed) {
            // The chain commit landed but the final status write did not
            record.status = JobStatus::COMPLETED;
            record.phase = JobPhase::COMPLETED;
            Logger::info("Recovered committed job " + record.jobId + " as completed");
        } else {
            rollbackImages(record);
            record.status = JobStatus::FAILED;
            record.phase = JobPhase::FAILED;
            record.errorKind = ErrorKind::INTERNAL;
            record.errorMessage = "orchestrator restarted before the job finished";
            Logger::warning("Failed interrupted job " + record.jobId + " and removed its images");
        }
        repository_->saveJob(record);
        ++recovered;
    }
    return recovered;
}

size_t BackupCoordinator::reconcileResources() {
    std::set<std::string> orphanOwners;
    for (const auto& lease : ports_->listLeased()) {
        if (!isActive(lease.ownerJobId)) {
            orphanOwners.insert(lease.ownerJobId);
        }
    }
    for (const auto& process : transfers_->listProcesses()) {
        if (!isActive(process.ownerJobId)) {
            orphanOwners.insert(process.ownerJobId);
        }
    }

    size_t reclaimed = 0;
    for (const auto& owner : orphanOwners) {
        size_t stopped = transfers_->stopAllForJob(owner);
        size_t released = ports_->releaseAll(owner);
        Logger::warning("Reclaimed " + std::to_string(released) + " ports and " + std::to_string(stopped) +
                        " transfer servers from inactive job " + owner);
        reclaimed += stopped + released;
    }
    return reclaimed;
}
