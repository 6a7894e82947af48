#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "test_fakes.hpp"
#include "common/process_utils.hpp"
#include "transfer/transfer_process_manager.hpp"
#include "transfer/transfer_server_launcher.hpp"
#include <arpa/inet.h>
#include <csignal>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

class TransferProcessManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        launcher_ = std::make_shared<ListeningLauncher>();
        TransferManagerOptions options;
        options.startupTimeout = std::chrono::milliseconds(3000);
        options.stopGrace = std::chrono::milliseconds(1000);
        options.releaseDelay = std::chrono::milliseconds(10);
        options.probeInterval = std::chrono::milliseconds(20);
        manager_ = std::make_unique<TransferProcessManager>(launcher_, options);

        image_ = dir_.file("disk0.qcow2");
        std::ofstream(image_) << "image";
    }

    TempDir dir_;
    std::string image_;
    std::shared_ptr<ListeningLauncher> launcher_;
    std::unique_ptr<TransferProcessManager> manager_;
};

TEST_F(TransferProcessManagerTest, StartWaitsUntilPortAcceptsConnections) {
    TransferProcess process = manager_->start(21100, image_, "vm-disk0", 4, "job-a", 0);
    EXPECT_EQ(process.state, TransferState::RUNNING);
    EXPECT_GT(process.pid, 0);
    EXPECT_EQ(manager_->getProcessCount(), 1u);
    EXPECT_TRUE(manager_->healthCheck(21100));

    EXPECT_TRUE(manager_->stop(21100));
    EXPECT_EQ(manager_->getProcessCount(), 0u);
    EXPECT_NE(kill(process.pid, 0), 0);
}

TEST_F(TransferProcessManagerTest, MissingImageIsRejectedBeforeLaunch) {
    try {
        manager_->start(21101, dir_.file("missing.qcow2"), "vm-disk0", 4, "job-a", 0);
        FAIL() << "expected TransferProcessStartFailed";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER_PROCESS_START_FAILED);
    }
    EXPECT_EQ(launcher_->launches(), 0);
}

TEST_F(TransferProcessManagerTest, ProcessExitingDuringStartupFails) {
    launcher_->setModeForPort(21102, ListeningLauncher::Mode::EXIT_AT_ONCE);
    EXPECT_THROW(manager_->start(21102, image_, "vm-disk0", 4, "job-a", 0), BackupError);
    EXPECT_EQ(manager_->getProcessCount(), 0u);
}

TEST_F(TransferProcessManagerTest, StartupTimeoutKillsProcess) {
    TransferManagerOptions options;
    options.startupTimeout = std::chrono::milliseconds(200);
    options.stopGrace = std::chrono::milliseconds(200);
    options.releaseDelay = std::chrono::milliseconds(0);
    options.probeInterval = std::chrono::milliseconds(20);
    auto launcher = std::make_shared<ListeningLauncher>(ListeningLauncher::Mode::NEVER_LISTEN);
    TransferProcessManager manager(launcher, options);

    try {
        manager.start(21103, image_, "vm-disk0", 4, "job-a", 0);
        FAIL() << "expected TransferProcessStartFailed";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER_PROCESS_START_FAILED);
        EXPECT_NE(std::string(e.what()).find("not accepting connections"), std::string::npos);
    }
    EXPECT_EQ(manager.getProcessCount(), 0u);
}

TEST_F(TransferProcessManagerTest, DuplicatePortIsRejected) {
    manager_->start(21104, image_, "vm-disk0", 4, "job-a", 0);
    EXPECT_THROW(manager_->start(21104, image_, "vm-disk1", 4, "job-b", 1), BackupError);
    EXPECT_EQ(manager_->getProcessCount(), 1u);
}

TEST_F(TransferProcessManagerTest, StopIsIdempotent) {
    manager_->start(21105, image_, "vm-disk0", 4, "job-a", 0);
    EXPECT_TRUE(manager_->stop(21105));
    EXPECT_TRUE(manager_->stop(21105));
    EXPECT_TRUE(manager_->stop(21999));
}

TEST_F(TransferProcessManagerTest, StopAllForJobLeavesOtherJobsRunning) {
    manager_->start(21106, image_, "a-disk0", 4, "job-a", 0);
    manager_->start(21107, image_, "a-disk1", 4, "job-a", 1);
    manager_->start(21108, image_, "b-disk0", 4, "job-b", 0);

    EXPECT_EQ(manager_->stopAllForJob("job-a"), 2u);
    auto remaining = manager_->listProcesses();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].ownerJobId, "job-b");
}

TEST_F(TransferProcessManagerTest, SweepReportsCrashOnce) {
    launcher_->dieAfter = std::chrono::milliseconds(200);
    launcher_->setModeForPort(21109, ListeningLauncher::Mode::LISTEN_THEN_DIE);

    std::vector<TransferProcess> reported;
    manager_->setFailureCallback([&reported](const TransferProcess& process) {
        reported.push_back(process);
    });

    manager_->start(21109, image_, "vm-disk0", 4, "job-a", 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    EXPECT_EQ(manager_->sweep(), 1u);
    EXPECT_EQ(manager_->sweep(), 0u);
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].port, 21109);
    EXPECT_EQ(reported[0].ownerJobId, "job-a");
    EXPECT_EQ(reported[0].state, TransferState::FAILED);
    EXPECT_FALSE(reported[0].failureReason.empty());

    // The failed entry stays until stopped so the port is not reused early
    EXPECT_EQ(manager_->getProcessCount(), 1u);
    EXPECT_TRUE(manager_->stop(21109));
    EXPECT_EQ(manager_->getProcessCount(), 0u);
}

TEST_F(TransferProcessManagerTest, ForeignListenerDoesNotMaskFailedStart) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    ASSERT_GE(fd, 0);
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(21110);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(listen(fd, 4), 0);

    launcher_->setModeForPort(21110, ListeningLauncher::Mode::EXIT_AT_ONCE);
    try {
        manager_->start(21110, image_, "vm-disk0", 4, "job-a", 0);
        FAIL() << "expected TransferProcessStartFailed";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSFER_PROCESS_START_FAILED);
    }
    EXPECT_EQ(manager_->getProcessCount(), 0u);
    close(fd);
}

TEST_F(TransferProcessManagerTest, StrayServerStoppedOnlyWhenIdentityMatches) {
    TransferLaunchRequest request;
    request.port = 21111;
    request.imagePath = image_;
    std::string error;
    pid_t stray = launcher_->launch(request, error);
    ASSERT_GT(stray, 0) << error;

    EXPECT_FALSE(manager_->stopStrayServer(stray, 21112));
    EXPECT_TRUE(process::isAlive(stray));
    EXPECT_FALSE(manager_->stopStrayServer(0, 21111));

    EXPECT_TRUE(manager_->stopStrayServer(stray, 21111));
    EXPECT_FALSE(process::isAlive(stray));
}

TEST_F(TransferProcessManagerTest, TrackedServerIsNotTreatedAsStray) {
    TransferProcess process = manager_->start(21112, image_, "vm-disk0", 4, "job-a", 0);
    EXPECT_FALSE(manager_->stopStrayServer(process.pid, 21112));
    EXPECT_TRUE(manager_->healthCheck(21112));
}

TEST(QemuNbdLauncherTest, RecognizesOwnCommandLine) {
    QemuNbdLauncher launcher("/usr/bin/qemu-nbd");
    TransferLaunchRequest request;
    request.port = 10809;
    request.imagePath = "/backups/vm-1/disk0/full.qcow2";
    request.exportName = "vm-1-disk0";

    std::vector<std::string> args = launcher.buildArguments(request);
    args[0] = "qemu-nbd";
    EXPECT_TRUE(launcher.matchesCommandLine(args, 10809));
    EXPECT_FALSE(launcher.matchesCommandLine(args, 10810));
    EXPECT_FALSE(launcher.matchesCommandLine({"sleep", "30"}, 10809));
    EXPECT_FALSE(launcher.matchesCommandLine({}, 10809));
}
