#include <gtest/gtest.h>
#include "backup/backup_coordinator.hpp"
#include "backup/target_descriptor.hpp"
#include "common/process_utils.hpp"
#include "storage/catalog_database.hpp"
#include "telemetry/stale_job_detector.hpp"
#include "telemetry/telemetry_receiver.hpp"
#include "test_fakes.hpp"

class BackupCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Per-process port range so parallel test processes do not collide
        basePort_ = 22000 + static_cast<int>(getpid() % 80) * 100;

        repository_ = std::make_shared<CatalogRepository>(std::make_shared<CatalogDatabase>(":memory:"));
        images_ = std::make_shared<FakeImageManager>();
        chains_ = std::make_shared<ChainManager>(repository_, images_, dir_.path());
        ports_ = std::make_shared<PortAllocator>(basePort_, basePort_ + 99);

        launcher_ = std::make_shared<ListeningLauncher>();
        TransferManagerOptions transferOptions;
        transferOptions.startupTimeout = std::chrono::milliseconds(3000);
        transferOptions.stopGrace = std::chrono::milliseconds(500);
        transferOptions.releaseDelay = std::chrono::milliseconds(0);
        transferOptions.probeInterval = std::chrono::milliseconds(20);
        transfers_ = std::make_shared<TransferProcessManager>(launcher_, transferOptions);

        inventory_ = std::make_shared<FakeInventory>();
        inventory_->addVm("vm-1", 2);
        inventory_->addVm("vm-3", 3);
        agent_ = std::make_shared<FakeCaptureAgent>();
        taskManager_ = std::make_shared<ParallelTaskManager>(4, "test-provisioning");

        CoordinatorOptions options;
        options.telemetryUrl = "http://orchestrator:8082";
        makeCoordinator(options);
    }

    void TearDown() override {
        transfers_->stopAll();
    }

    void makeCoordinator(const CoordinatorOptions& options) {
        coordinator_ = std::make_shared<BackupCoordinator>(ports_, transfers_, chains_, repository_, inventory_,
                                                           agent_, taskManager_, options);
        std::weak_ptr<BackupCoordinator> weak = coordinator_;
        transfers_->setFailureCallback([weak](const TransferProcess& process) {
            if (auto coordinator = weak.lock()) {
                coordinator->onTransferFailure(process);
            }
        });
        telemetry_ = std::make_shared<TelemetryReceiver>(coordinator_);
    }

    void completeAll(const BackupJobRecord& job, const std::string& tokenPrefix = "ct") {
        for (const auto& disk : job.disks) {
            telemetry_->completeDisk(job.jobId, disk.diskIndex,
                                     tokenPrefix + "-" + std::to_string(disk.diskIndex), 1024);
        }
    }

    BackupJobRecord load(const std::string& jobId) {
        BackupJobRecord job;
        EXPECT_TRUE(coordinator_->getJob(jobId, job));
        return job;
    }

    ErrorKind kindOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const BackupError& e) {
            return e.kind();
        }
        return ErrorKind::NONE;
    }

    void expectNoResourcesHeld() {
        EXPECT_EQ(ports_->allocatedCount(), 0u);
        EXPECT_EQ(transfers_->getProcessCount(), 0u);
        EXPECT_TRUE(coordinator_->getActiveJobs().empty());
    }

    TempDir dir_;
    int basePort_{0};
    std::shared_ptr<CatalogRepository> repository_;
    std::shared_ptr<FakeImageManager> images_;
    std::shared_ptr<ChainManager> chains_;
    std::shared_ptr<PortAllocator> ports_;
    std::shared_ptr<ListeningLauncher> launcher_;
    std::shared_ptr<TransferProcessManager> transfers_;
    std::shared_ptr<FakeInventory> inventory_;
    std::shared_ptr<FakeCaptureAgent> agent_;
    std::shared_ptr<ParallelTaskManager> taskManager_;
    std::shared_ptr<BackupCoordinator> coordinator_;
    std::shared_ptr<TelemetryReceiver> telemetry_;
};

TEST_F(BackupCoordinatorTest, FullBackupOfTwoDiskVm) {
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);

    EXPECT_EQ(job.status, JobStatus::RUNNING);
    EXPECT_EQ(job.phase, JobPhase::AWAITING_COMPLETION);
    ASSERT_EQ(job.disks.size(), 2u);
    EXPECT_NE(job.disks[0].port, job.disks[1].port);
    for (const auto& disk : job.disks) {
        EXPECT_EQ(disk.status, DiskStatus::TRANSFERRING);
        EXPECT_TRUE(ports_->isLeased(disk.port));
        EXPECT_TRUE(images_->exists(disk.imagePath));
        EXPECT_GT(disk.qemuProcessPid, 0);
    }
    EXPECT_EQ(transfers_->getProcessCount(), 2u);

    // One capture call carrying one target per disk
    EXPECT_EQ(agent_->calls(), 1);
    CaptureRequest request = agent_->lastRequest();
    std::vector<TargetEntry> targets;
    std::string error;
    ASSERT_TRUE(parseTargetDescriptor(request.targetDescriptor, targets, error)) << error;
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].diskKey, "2000");
    EXPECT_EQ(targets[1].diskKey, "2001");
    EXPECT_EQ(targets[0].port, job.disks[0].port);
    EXPECT_EQ(targets[1].exportName, "vm-1-disk1");
    EXPECT_TRUE(request.changeTrackingTokens.empty());
    EXPECT_EQ(request.telemetryUrl, "http://orchestrator:8082/api/v1/telemetry/backup/" + job.jobId);

    completeAll(job);

    BackupJobRecord done = load(job.jobId);
    EXPECT_EQ(done.status, JobStatus::COMPLETED);
    EXPECT_EQ(done.phase, JobPhase::COMPLETED);
    EXPECT_EQ(done.errorKind, ErrorKind::NONE);
    EXPECT_NE(done.completedAt, TimePoint{});
    expectNoResourcesHeld();

    for (int disk = 0; disk < 2; ++disk) {
        BackupChain chain;
        ASSERT_TRUE(chains_->getChain("vm-1", disk, chain));
        EXPECT_EQ(chain.totalBackups, 1);
        BackupRecord latest;
        ASSERT_TRUE(chains_->getLatestBackup("vm-1", disk, latest));
        EXPECT_EQ(latest.changeTrackingId, "ct-" + std::to_string(disk));
        EXPECT_EQ(latest.jobId, job.jobId);
        EXPECT_TRUE(images_->exists(latest.imagePath));
        EXPECT_TRUE(std::filesystem::exists(latest.imagePath + ".json"));
    }

    BackupJobRecord stored;
    ASSERT_TRUE(repository_->loadJob(job.jobId, stored));
    EXPECT_EQ(stored.status, JobStatus::COMPLETED);
}

TEST_F(BackupCoordinatorTest, IncrementalExtendsChainWithPreviousToken) {
    BackupJobRecord full = coordinator_->startBackup("vm-1", BackupType::FULL);
    completeAll(full, "ct-full");

    BackupJobRecord inc = coordinator_->startBackup("vm-1", BackupType::INCREMENTAL);
    CaptureRequest request = agent_->lastRequest();
    EXPECT_EQ(request.backupType, "incremental");
    EXPECT_EQ(request.changeTrackingTokens["2000"], "ct-full-0");
    EXPECT_EQ(request.changeTrackingTokens["2001"], "ct-full-1");
    EXPECT_EQ(inc.disks[0].previousChangeTrackingId, "ct-full-0");
    EXPECT_EQ(inc.disks[0].parentBackupId, full.disks[0].backupId);

    ImageInfo info;
    std::string error;
    ASSERT_TRUE(images_->getInfo(inc.disks[0].imagePath, info, error)) << error;
    EXPECT_EQ(info.backingFile, full.disks[0].imagePath);

    completeAll(inc, "ct-inc");
    EXPECT_EQ(load(inc.jobId).status, JobStatus::COMPLETED);

    BackupChain chain;
    ASSERT_TRUE(chains_->getChain("vm-1", 0, chain));
    EXPECT_EQ(chain.totalBackups, 2);
    EXPECT_EQ(chain.fullBackupId, full.disks[0].backupId);
    EXPECT_EQ(chain.latestBackupId, inc.disks[0].backupId);
    EXPECT_TRUE(chains_->validateChain("vm-1", 0, error)) << error;
    EXPECT_TRUE(chains_->validateChain("vm-1", 1, error)) << error;
}

TEST_F(BackupCoordinatorTest, RepeatedIncrementalsStayLinear) {
    completeAll(coordinator_->startBackup("vm-1", BackupType::FULL));
    for (int i = 0; i < 3; ++i) {
        completeAll(coordinator_->startBackup("vm-1", BackupType::INCREMENTAL), "ct-" + std::to_string(i));
    }

    BackupChain chain;
    ASSERT_TRUE(chains_->getChain("vm-1", 1, chain));
    EXPECT_EQ(chain.totalBackups, 4);
    auto backups = chains_->listBackups("vm-1", 1);
    ASSERT_EQ(backups.size(), 4u);
    EXPECT_EQ(backups.back().backupType, BackupType::FULL);
}

TEST_F(BackupCoordinatorTest, IncrementalWithoutChainFailsBeforeAnyAllocation) {
    EXPECT_EQ(kindOf([&]() { coordinator_->startBackup("vm-1", BackupType::INCREMENTAL); }),
              ErrorKind::PARENT_BACKUP_MISSING);

    EXPECT_EQ(agent_->calls(), 0);
    EXPECT_EQ(launcher_->launches(), 0);
    expectNoResourcesHeld();

    auto jobs = coordinator_->listJobs("vm-1");
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].status, JobStatus::FAILED);
    EXPECT_EQ(jobs[0].errorKind, ErrorKind::PARENT_BACKUP_MISSING);
}

TEST_F(BackupCoordinatorTest, IncrementalNeedsEveryDiskChain) {
    BackupJobRecord full = coordinator_->startBackup("vm-1", BackupType::FULL);
    completeAll(full);

    // A disk added to the VM since the full backup has no chain yet
    inventory_->addVm("vm-1", 3);
    EXPECT_EQ(kindOf([&]() { coordinator_->startBackup("vm-1", BackupType::INCREMENTAL); }),
              ErrorKind::PARENT_BACKUP_MISSING);
    EXPECT_EQ(agent_->calls(), 1);
    EXPECT_EQ(launcher_->launches(), 2);
    expectNoResourcesHeld();
}

TEST_F(BackupCoordinatorTest, IncrementalRejectsTailWithoutToken) {
    BackupJobRecord full = coordinator_->startBackup("vm-1", BackupType::FULL);
    for (const auto& disk : full.disks) {
        telemetry_->completeDisk(full.jobId, disk.diskIndex, "", 1024);
    }
    ASSERT_EQ(load(full.jobId).status, JobStatus::COMPLETED);

    EXPECT_EQ(kindOf([&]() { coordinator_->startBackup("vm-1", BackupType::INCREMENTAL); }),
              ErrorKind::PARENT_BACKUP_MISSING);
    EXPECT_EQ(ports_->allocatedCount(), 0u);
}

TEST_F(BackupCoordinatorTest, IncrementalRejectsBrokenChain) {
    BackupJobRecord full = coordinator_->startBackup("vm-1", BackupType::FULL);
    completeAll(full);
    std::filesystem::remove(full.disks[1].imagePath);

    EXPECT_EQ(kindOf([&]() { coordinator_->startBackup("vm-1", BackupType::INCREMENTAL); }),
              ErrorKind::PARENT_BACKUP_MISSING);
    EXPECT_EQ(agent_->calls(), 1);
    expectNoResourcesHeld();
}

TEST_F(BackupCoordinatorTest, ProcessStartFailureRollsBackEveryDisk) {
    launcher_->setModeForPort(basePort_ + 1, ListeningLauncher::Mode::EXIT_AT_ONCE);

    std::string jobId;
    try {
        coordinator_->startBackup("vm-1", BackupType::FULL);
        FAIL() << "expected TransferProcessStartFailed";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER_PROCESS_START_FAILED);
        jobId = e.jobId();
    }

    EXPECT_EQ(agent_->calls(), 0);
    expectNoResourcesHeld();

    BackupJobRecord failed = load(jobId);
    EXPECT_EQ(failed.status, JobStatus::FAILED);
    EXPECT_EQ(failed.errorKind, ErrorKind::TRANSFER_PROCESS_START_FAILED);
    for (const auto& disk : failed.disks) {
        EXPECT_FALSE(images_->exists(disk.imagePath)) << disk.imagePath;
        EXPECT_EQ(disk.status, DiskStatus::FAILED);
    }
    BackupChain chain;
    EXPECT_FALSE(chains_->getChain("vm-1", 0, chain));
}

TEST_F(BackupCoordinatorTest, PoolExhaustionReleasesPartialLeases) {
    ports_ = std::make_shared<PortAllocator>(basePort_, basePort_ + 1);
    makeCoordinator(CoordinatorOptions());

    EXPECT_EQ(kindOf([&]() { coordinator_->startBackup("vm-3", BackupType::FULL); }),
              ErrorKind::POOL_EXHAUSTED);
    EXPECT_EQ(launcher_->launches(), 0);
    EXPECT_EQ(ports_->availableCount(), 2u);
    expectNoResourcesHeld();
}

TEST_F(BackupCoordinatorTest, ImageCreationFailureAbortsBeforeCapture) {
    images_->failCreationContaining("disk1");
    EXPECT_EQ(kindOf([&]() { coordinator_->startBackup("vm-1", BackupType::FULL); }),
              ErrorKind::IMAGE_CREATION_FAILED);
    EXPECT_EQ(agent_->calls(), 0);
    expectNoResourcesHeld();
}

TEST_F(BackupCoordinatorTest, UnknownVmFailsDiskResolution) {
    EXPECT_EQ(kindOf([&]() { coordinator_->startBackup("vm-missing", BackupType::FULL); }),
              ErrorKind::DISK_RESOLUTION_FAILED);
    EXPECT_EQ(kindOf([&]() { coordinator_->startBackup("", BackupType::FULL); }),
              ErrorKind::INVALID_REQUEST);
}

TEST_F(BackupCoordinatorTest, CaptureAgentFailureRollsBack) {
    agent_->failWith = ErrorKind::CAPTURE_AGENT_UNREACHABLE;

    std::string jobId;
    try {
        coordinator_->startBackup("vm-1", BackupType::FULL);
        FAIL() << "expected CaptureAgentUnreachable";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CAPTURE_AGENT_UNREACHABLE);
        jobId = e.jobId();
    }

    EXPECT_EQ(agent_->calls(), 1);
    expectNoResourcesHeld();
    for (const auto& disk : load(jobId).disks) {
        EXPECT_FALSE(images_->exists(disk.imagePath));
    }
}

TEST_F(BackupCoordinatorTest, OneFailedDiskFailsWholeJob) {
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);
    telemetry_->completeDisk(job.jobId, 0, "ct-0", 1024);
    EXPECT_TRUE(coordinator_->isActive(job.jobId));

    TelemetrySnapshot failure;
    failure.status = DiskStatus::FAILED;
    failure.errorMessage = "read error on source disk";
    failure.timestamp = std::chrono::system_clock::now();
    telemetry_->receiveUpdate(job.jobId, 1, failure);

    BackupJobRecord failed = load(job.jobId);
    EXPECT_EQ(failed.status, JobStatus::FAILED);
    EXPECT_EQ(failed.errorKind, ErrorKind::DISK_TRANSFER_FAILED);
    EXPECT_NE(failed.errorMessage.find("read error"), std::string::npos);
    expectNoResourcesHeld();

    // The completed disk is not committed either
    BackupChain chain;
    EXPECT_FALSE(chains_->getChain("vm-1", 0, chain));
    EXPECT_FALSE(chains_->getChain("vm-1", 1, chain));
    EXPECT_FALSE(images_->exists(job.disks[0].imagePath));
}

TEST_F(BackupCoordinatorTest, CommitFailureDeletesImages) {
    CoordinatorOptions options;
    options.verifyImages = true;
    makeCoordinator(options);

    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);
    images_->failCheckFor(job.disks[1].imagePath);
    completeAll(job);

    BackupJobRecord failed = load(job.jobId);
    EXPECT_EQ(failed.status, JobStatus::FAILED);
    EXPECT_EQ(failed.errorKind, ErrorKind::CHAIN_COMMIT_FAILED);
    for (const auto& disk : job.disks) {
        EXPECT_FALSE(images_->exists(disk.imagePath));
    }
    BackupChain chain;
    EXPECT_FALSE(chains_->getChain("vm-1", 0, chain));
    expectNoResourcesHeld();
}

TEST_F(BackupCoordinatorTest, StaleJobIsStalledThenFailed) {
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);
    StaleJobDetector detector(coordinator_, StaleThresholds{std::chrono::seconds(60), std::chrono::seconds(300)});
    TimePoint now = std::chrono::system_clock::now();

    auto result = detector.sweepStaleJobs(now + std::chrono::seconds(30));
    EXPECT_EQ(result.stalled, 0u);
    EXPECT_EQ(load(job.jobId).status, JobStatus::RUNNING);

    result = detector.sweepStaleJobs(now + std::chrono::seconds(61));
    EXPECT_EQ(result.stalled, 1u);
    EXPECT_EQ(load(job.jobId).status, JobStatus::STALLED);
    EXPECT_TRUE(coordinator_->isActive(job.jobId));

    result = detector.sweepStaleJobs(now + std::chrono::seconds(301));
    EXPECT_EQ(result.failed, 1u);
    BackupJobRecord failed = load(job.jobId);
    EXPECT_EQ(failed.status, JobStatus::FAILED);
    EXPECT_EQ(failed.errorKind, ErrorKind::STALE_JOB);
    expectNoResourcesHeld();
    for (const auto& disk : job.disks) {
        EXPECT_FALSE(images_->exists(disk.imagePath));
    }
}

TEST_F(BackupCoordinatorTest, StalledJobRecoversOnTelemetry) {
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);
    StaleJobDetector detector(coordinator_, StaleThresholds());
    detector.sweepStaleJobs(std::chrono::system_clock::now() + std::chrono::seconds(90));
    ASSERT_EQ(load(job.jobId).status, JobStatus::STALLED);

    TelemetrySnapshot progress;
    progress.bytesTransferred = 100;
    progress.timestamp = std::chrono::system_clock::now();
    telemetry_->receiveUpdate(job.jobId, 0, progress);
    EXPECT_EQ(load(job.jobId).status, JobStatus::RUNNING);
}

TEST_F(BackupCoordinatorTest, CancelRollsBackAndIsNotRepeatable) {
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);
    BackupJobRecord cancelled = coordinator_->cancelBackup(job.jobId);
    EXPECT_EQ(cancelled.status, JobStatus::FAILED);
    EXPECT_EQ(cancelled.errorKind, ErrorKind::CANCELLED);
    expectNoResourcesHeld();

    EXPECT_EQ(kindOf([&]() { coordinator_->cancelBackup(job.jobId); }), ErrorKind::INVALID_REQUEST);
    EXPECT_EQ(kindOf([&]() { coordinator_->cancelBackup("job-nope"); }), ErrorKind::NOT_FOUND);
}

TEST_F(BackupCoordinatorTest, CancelDuringCaptureIsHonouredAfterwards) {
    agent_->onCapture = [this](const CaptureRequest& request) {
        coordinator_->cancelBackup(request.jobId);
    };
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);
    EXPECT_EQ(job.status, JobStatus::FAILED);
    EXPECT_EQ(job.errorKind, ErrorKind::CANCELLED);
    expectNoResourcesHeld();
}

TEST_F(BackupCoordinatorTest, TelemetryDuringCaptureCallIsKept) {
    agent_->onCapture = [this](const CaptureRequest& request) {
        telemetry_->completeDisk(request.jobId, 0, "ct-early-0", 1024);
        telemetry_->completeDisk(request.jobId, 1, "ct-early-1", 1024);
    };
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);
    EXPECT_EQ(job.status, JobStatus::COMPLETED);

    BackupRecord latest;
    ASSERT_TRUE(chains_->getLatestBackup("vm-1", 1, latest));
    EXPECT_EQ(latest.changeTrackingId, "ct-early-1");
}

TEST_F(BackupCoordinatorTest, SecondJobForSameVmIsRejected) {
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);
    EXPECT_EQ(kindOf([&]() { coordinator_->startBackup("vm-1", BackupType::FULL); }),
              ErrorKind::BACKUP_IN_PROGRESS);
    EXPECT_EQ(agent_->calls(), 1);
    EXPECT_EQ(ports_->allocatedCount(), 2u);

    BackupJobRecord other = coordinator_->startBackup("vm-3", BackupType::FULL);
    EXPECT_EQ(ports_->allocatedCount(), 5u);
    coordinator_->cancelBackup(job.jobId);
    coordinator_->cancelBackup(other.jobId);
}

TEST_F(BackupCoordinatorTest, TransferCrashFailsJob) {
    launcher_->dieAfter = std::chrono::milliseconds(200);
    launcher_->setModeForPort(basePort_, ListeningLauncher::Mode::LISTEN_THEN_DIE);
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    EXPECT_EQ(transfers_->sweep(), 1u);

    BackupJobRecord failed = load(job.jobId);
    EXPECT_EQ(failed.status, JobStatus::FAILED);
    EXPECT_EQ(failed.errorKind, ErrorKind::TRANSFER_PROCESS_FAILED);
    expectNoResourcesHeld();
}

TEST_F(BackupCoordinatorTest, TransferDeathDuringProvisioningAbortsBeforeCapture) {
    // Disk 1 is serving and dead before disk 0 finishes provisioning
    images_->delayCreationContaining("/disk0/", std::chrono::milliseconds(800));
    launcher_->dieAfter = std::chrono::milliseconds(100);
    launcher_->setModeForPort(basePort_ + 1, ListeningLauncher::Mode::LISTEN_THEN_DIE);

    std::thread sweeper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        transfers_->sweep();
    });

    std::string jobId;
    try {
        coordinator_->startBackup("vm-1", BackupType::FULL);
        ADD_FAILURE() << "expected TransferProcessFailed";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER_PROCESS_FAILED);
        jobId = e.jobId();
    }
    sweeper.join();

    EXPECT_EQ(agent_->calls(), 0);
    expectNoResourcesHeld();
    BackupJobRecord failed = load(jobId);
    EXPECT_EQ(failed.status, JobStatus::FAILED);
    ASSERT_EQ(failed.disks.size(), 2u);
    EXPECT_EQ(failed.disks[1].status, DiskStatus::FAILED);
}

TEST_F(BackupCoordinatorTest, RecoveryStopsStrayTransferServers) {
    TransferLaunchRequest request;
    request.port = basePort_ + 50;
    std::string error;
    pid_t stray = launcher_->launch(request, error);
    ASSERT_GT(stray, 0) << error;
    pid_t unrelated = process::spawn({"sleep", "30"}, "", error);
    ASSERT_GT(unrelated, 0) << error;

    BackupJobRecord orphan;
    orphan.jobId = "job-interrupted";
    orphan.vmIdentifier = "vm-1";
    orphan.status = JobStatus::RUNNING;
    orphan.phase = JobPhase::AWAITING_COMPLETION;
    for (int index = 0; index < 2; ++index) {
        DiskResult disk;
        disk.diskIndex = index;
        disk.backupId = "bk-interrupted-" + std::to_string(index);
        disk.port = basePort_ + 50 + index;
        disk.status = DiskStatus::TRANSFERRING;
        orphan.disks.push_back(disk);
    }
    orphan.disks[0].qemuProcessPid = stray;
    orphan.disks[1].qemuProcessPid = unrelated;
    repository_->saveJob(orphan);

    EXPECT_EQ(coordinator_->recoverInterruptedJobs(), 1u);

    EXPECT_FALSE(process::isAlive(stray));
    // A reused pid that is not a transfer server is left alone
    EXPECT_TRUE(process::isAlive(unrelated));
    BackupJobRecord recovered;
    ASSERT_TRUE(repository_->loadJob("job-interrupted", recovered));
    EXPECT_EQ(recovered.status, JobStatus::FAILED);

    int status = 0;
    process::terminate(unrelated, std::chrono::milliseconds(500), status);
}

TEST_F(BackupCoordinatorTest, RecoveryFailsUncommittedJobsAndKeepsCommittedOnes) {
    BackupJobRecord committed = coordinator_->startBackup("vm-1", BackupType::FULL);
    completeAll(committed);
    BackupJobRecord stored;
    ASSERT_TRUE(repository_->loadJob(committed.jobId, stored));
    stored.status = JobStatus::RUNNING;
    stored.phase = JobPhase::COMMITTING;
    repository_->saveJob(stored);

    BackupJobRecord orphan;
    orphan.jobId = "job-orphan";
    orphan.vmIdentifier = "vm-3";
    orphan.status = JobStatus::RUNNING;
    orphan.phase = JobPhase::AWAITING_COMPLETION;
    DiskResult disk;
    disk.backupId = "bk-orphan";
    disk.imagePath = chains_->createImage("vm-3", 0, "bk-orphan", BackupType::FULL, 1024, "");
    orphan.disks.push_back(disk);
    repository_->saveJob(orphan);

    EXPECT_EQ(coordinator_->recoverInterruptedJobs(), 2u);

    BackupJobRecord recovered;
    ASSERT_TRUE(repository_->loadJob(committed.jobId, recovered));
    EXPECT_EQ(recovered.status, JobStatus::COMPLETED);
    ASSERT_TRUE(repository_->loadJob("job-orphan", recovered));
    EXPECT_EQ(recovered.status, JobStatus::FAILED);
    EXPECT_FALSE(images_->exists(disk.imagePath));
    EXPECT_TRUE(repository_->listUnfinishedJobs().empty());
}

TEST_F(BackupCoordinatorTest, ReconcileReleasesOrphanedLeases) {
    BackupJobRecord job = coordinator_->startBackup("vm-1", BackupType::FULL);
    int ghost = ports_->allocate("job-ghost", 0);

    EXPECT_EQ(coordinator_->reconcileResources(), 1u);
    EXPECT_FALSE(ports_->isLeased(ghost));
    EXPECT_EQ(ports_->getPortsForJob(job.jobId).size(), 2u);
    EXPECT_EQ(transfers_->getProcessCount(), 2u);
    coordinator_->cancelBackup(job.jobId);
}
