#include <gtest/gtest.h>
#include "api/api_handler.hpp"
#include "api/http_server.hpp"
#include "backup/backup_coordinator.hpp"
#include "common/process_utils.hpp"
#include "storage/catalog_database.hpp"
#include "telemetry/telemetry_receiver.hpp"
#include "test_fakes.hpp"

class ApiHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        basePort_ = 32000 + static_cast<int>(getpid() % 5) * 100;

        auto repository = std::make_shared<CatalogRepository>(std::make_shared<CatalogDatabase>(":memory:"));
        images_ = std::make_shared<FakeImageManager>();
        chains_ = std::make_shared<ChainManager>(repository, images_, dir_.path());
        ports_ = std::make_shared<PortAllocator>(basePort_, basePort_ + 1);

        TransferManagerOptions transferOptions;
        transferOptions.startupTimeout = std::chrono::milliseconds(3000);
        transferOptions.stopGrace = std::chrono::milliseconds(500);
        transferOptions.releaseDelay = std::chrono::milliseconds(0);
        transferOptions.probeInterval = std::chrono::milliseconds(20);
        transfers_ = std::make_shared<TransferProcessManager>(std::make_shared<ListeningLauncher>(),
                                                              transferOptions);

        inventory_ = std::make_shared<FakeInventory>();
        inventory_->addVm("vm-1", 1);
        inventory_->addVm("vm-big", 3);
        agent_ = std::make_shared<FakeCaptureAgent>();
        coordinator_ = std::make_shared<BackupCoordinator>(ports_, transfers_, chains_, repository, inventory_,
                                                           agent_, std::make_shared<ParallelTaskManager>(2, "test"));
        handler_ = std::make_shared<ApiHandler>(coordinator_, std::make_shared<TelemetryReceiver>(coordinator_),
                                                chains_, ports_, transfers_);
    }

    void TearDown() override {
        transfers_->stopAll();
    }

    ApiResponse call(const std::string& method, const std::string& path,
                     const nlohmann::json& body = nullptr) {
        ApiRequest request;
        request.method = method;
        request.path = path;
        if (!body.is_null()) {
            request.body = body.dump();
        }
        return handler_->handle(request);
    }

    std::string startFullBackup(const std::string& vm = "vm-1") {
        ApiResponse response = call("POST", "/api/v1/backups", {{"vm_identifier", vm}, {"backup_type", "full"}});
        EXPECT_EQ(response.status, 201) << response.body.dump();
        return response.body.value("job_id", "");
    }

    TempDir dir_;
    int basePort_{0};
    std::shared_ptr<FakeImageManager> images_;
    std::shared_ptr<ChainManager> chains_;
    std::shared_ptr<PortAllocator> ports_;
    std::shared_ptr<TransferProcessManager> transfers_;
    std::shared_ptr<FakeInventory> inventory_;
    std::shared_ptr<FakeCaptureAgent> agent_;
    std::shared_ptr<BackupCoordinator> coordinator_;
    std::shared_ptr<ApiHandler> handler_;
};

TEST_F(ApiHandlerTest, StartBackupReturnsDescriptor) {
    ApiResponse response = call("POST", "/api/v1/backups", {{"vm_identifier", "vm-1"}});
    ASSERT_EQ(response.status, 201) << response.body.dump();
    EXPECT_EQ(response.body["backup_type"], "full");
    EXPECT_EQ(response.body["phase"], "awaiting_completion");
    EXPECT_EQ(response.body["disk_results"].size(), 1u);

    std::string expected = "2000:nbd://127.0.0.1:" + std::to_string(basePort_) + "/vm-1-disk0";
    EXPECT_EQ(response.body["combined_target_descriptor"], expected);
}

TEST_F(ApiHandlerTest, FullLifecycleOverRoutes) {
    std::string jobId = startFullBackup();
    ASSERT_FALSE(jobId.empty());

    ApiResponse telemetry = call("POST", "/api/v1/telemetry/backup/" + jobId,
                                 {{"job_id", jobId}, {"current_phase", "copying"},
                                  {"disks", nlohmann::json::array({{{"disk_index", 0}, {"bytes_transferred", 512},
                                                                    {"total_bytes", 1024}}})}});
    EXPECT_EQ(telemetry.status, 200) << telemetry.body.dump();
    EXPECT_EQ(telemetry.body["applied_disks"], 1);

    ApiResponse running = call("GET", "/api/v1/backups/" + jobId);
    EXPECT_EQ(running.body["status"], "running");
    EXPECT_EQ(running.body["bytes_transferred"], 512);

    ApiResponse complete = call("POST", "/api/v1/backups/" + jobId + "/disks/0/complete",
                                {{"change_id", "52 de/1"}, {"bytes_transferred", 1024}});
    EXPECT_EQ(complete.status, 200);
    EXPECT_EQ(complete.body["applied"], true);

    ApiResponse done = call("GET", "/backups/" + jobId);
    EXPECT_EQ(done.body["status"], "completed");

    ApiResponse chain = call("GET", "/api/v1/chains/vm-1/0");
    ASSERT_EQ(chain.status, 200) << chain.body.dump();
    EXPECT_EQ(chain.body["total_backups"], 1);
    EXPECT_EQ(chain.body["valid"], true);
    EXPECT_EQ(chain.body["backups"][0]["change_tracking_id"], "52 de/1");

    ApiResponse list = call("GET", "/api/v1/backups");
    EXPECT_EQ(list.body["count"], 1);
}

TEST_F(ApiHandlerTest, ErrorKindsMapToStatusCodes) {
    EXPECT_EQ(ApiHandler::statusForError(ErrorKind::INVALID_REQUEST), 400);
    EXPECT_EQ(ApiHandler::statusForError(ErrorKind::NOT_FOUND), 404);
    EXPECT_EQ(ApiHandler::statusForError(ErrorKind::PARENT_BACKUP_MISSING), 409);
    EXPECT_EQ(ApiHandler::statusForError(ErrorKind::BACKUP_IN_PROGRESS), 409);
    EXPECT_EQ(ApiHandler::statusForError(ErrorKind::POOL_EXHAUSTED), 503);
    EXPECT_EQ(ApiHandler::statusForError(ErrorKind::CAPTURE_AGENT_UNREACHABLE), 502);
    EXPECT_EQ(ApiHandler::statusForError(ErrorKind::CHAIN_COMMIT_FAILED), 500);

    ApiResponse response = ApiHandler::errorResponse(ErrorKind::STALE_JOB, "silent", "job-9");
    EXPECT_EQ(response.body["error_kind"], "StaleJob");
    EXPECT_EQ(response.body["job_id"], "job-9");
}

TEST_F(ApiHandlerTest, BadRequestsAreRejected) {
    EXPECT_EQ(call("POST", "/api/v1/backups", nlohmann::json::object()).status, 400);
    EXPECT_EQ(call("POST", "/api/v1/backups", {{"vm_identifier", "vm-1"}, {"backup_type", "differential"}}).status,
              400);

    ApiRequest garbage;
    garbage.method = "POST";
    garbage.path = "/api/v1/backups";
    garbage.body = "{not json";
    ApiResponse response = handler_->handle(garbage);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["error_kind"], "InvalidRequest");

    EXPECT_EQ(call("GET", "/api/v1/nothing-here").status, 404);
    EXPECT_EQ(call("GET", "/api/v1/backups/job-missing").status, 404);
    EXPECT_EQ(call("GET", "/api/v1/chains/vm-1/abc").status, 400);
    EXPECT_EQ(call("POST", "/api/v1/telemetry/backup/job-missing", nlohmann::json::object()).status, 404);
}

TEST_F(ApiHandlerTest, OrchestrationFailuresCarryKind) {
    ApiResponse response = call("POST", "/api/v1/backups", {{"vm_identifier", "vm-1"}, {"backup_type", "incremental"}});
    EXPECT_EQ(response.status, 409);
    EXPECT_EQ(response.body["error_kind"], "ParentBackupMissing");
    EXPECT_TRUE(response.body.contains("job_id"));

    response = call("POST", "/api/v1/backups", {{"vm_identifier", "vm-big"}});
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(response.body["error_kind"], "PoolExhausted");

    std::string jobId = startFullBackup();
    response = call("POST", "/api/v1/backups", {{"vm_identifier", "vm-1"}});
    EXPECT_EQ(response.status, 409);
    EXPECT_EQ(response.body["error_kind"], "BackupInProgress");

    response = call("POST", "/api/v1/backups/" + jobId + "/cancel");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["error_kind"], "Cancelled");
}

TEST_F(ApiHandlerTest, ResourceViews) {
    startFullBackup();

    ApiResponse ports = call("GET", "/api/v1/ports");
    EXPECT_EQ(ports.body["allocated_ports"], 1);
    EXPECT_EQ(ports.body["leases"].size(), 1u);

    ApiResponse transfers = call("GET", "/api/v1/transfers");
    EXPECT_EQ(transfers.body["count"], 1);

    ApiResponse health = call("GET", "/health");
    EXPECT_EQ(health.body["status"], "ok");
    EXPECT_EQ(health.body["active_jobs"], 1);
}

TEST_F(ApiHandlerTest, RemoveLatestOnlyTouchesTail) {
    std::string jobId = startFullBackup();
    call("POST", "/api/v1/backups/" + jobId + "/disks/0/complete", {{"change_id", "ct"}});

    ApiResponse removed = call("DELETE", "/api/v1/chains/vm-1/0/latest");
    ASSERT_EQ(removed.status, 200) << removed.body.dump();
    EXPECT_FALSE(removed.body["removed_backup_id"].get<std::string>().empty());
    EXPECT_EQ(call("GET", "/api/v1/chains/vm-1/0").status, 404);
    EXPECT_EQ(call("DELETE", "/api/v1/chains/vm-1/0/latest").status, 404);
}

TEST_F(ApiHandlerTest, RemoveLatestRefusedWhileVmHasRunningJob) {
    std::string first = startFullBackup();
    call("POST", "/api/v1/backups/" + first + "/disks/0/complete", {{"change_id", "ct-1"}});
    std::string running = startFullBackup();
    ASSERT_FALSE(running.empty());

    ApiResponse refused = call("DELETE", "/api/v1/chains/vm-1/0/latest");
    EXPECT_EQ(refused.status, 409);
    EXPECT_EQ(refused.body["error_kind"], "BackupInProgress");

    ApiResponse chain = call("GET", "/api/v1/chains/vm-1/0");
    ASSERT_EQ(chain.status, 200);
    EXPECT_EQ(chain.body["total_backups"], 1);

    call("POST", "/api/v1/backups/" + running + "/cancel");
    EXPECT_EQ(call("DELETE", "/api/v1/chains/vm-1/0/latest").status, 200);
}

TEST(HttpServerTest, SpawnedChildDoesNotKeepPortBound) {
    auto server = std::make_unique<HttpServer>(nullptr, "127.0.0.1", 0, 1);
    std::string error;
    ASSERT_TRUE(server->start(error)) << error;
    int port = server->getPort();

    pid_t child = process::spawn({"sleep", "5"}, "", error);
    ASSERT_GT(child, 0) << error;
    server->stop();

    HttpServer again(nullptr, "127.0.0.1", port, 1);
    EXPECT_TRUE(again.start(error)) << error;
    again.stop();

    int status = 0;
    process::terminate(child, std::chrono::milliseconds(500), status);
}

TEST(HttpServerTest, ParsesRequestHead) {
    ApiRequest request;
    size_t contentLength = 0;
    std::string error;
    std::string head = "POST /api/v1/backups?vm_identifier=web%2D01&limit=5 HTTP/1.1\r\n"
                       "Host: localhost\r\n"
                       "Content-Type: application/json\r\n"
                       "content-length: 42\r\n";

    ASSERT_TRUE(HttpServer::parseRequestHead(head, request, contentLength, error)) << error;
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.path, "/api/v1/backups");
    EXPECT_EQ(request.query["vm_identifier"], "web-01");
    EXPECT_EQ(request.query["limit"], "5");
    EXPECT_EQ(contentLength, 42u);
}

TEST(HttpServerTest, RejectsUnsupportedRequests) {
    ApiRequest request;
    size_t contentLength = 0;
    std::string error;

    EXPECT_FALSE(HttpServer::parseRequestHead("garbage\r\n", request, contentLength, error));
    EXPECT_FALSE(HttpServer::parseRequestHead("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n",
                                              request, contentLength, error));
    EXPECT_NE(error.find("Transfer-Encoding"), std::string::npos);
    EXPECT_FALSE(HttpServer::parseRequestHead("POST / HTTP/1.1\r\nContent-Length: many\r\n",
                                              request, contentLength, error));
}

TEST(HttpServerTest, FormatsJsonResponse) {
    ApiResponse response;
    response.status = 409;
    response.body = {{"error", "busy"}};

    std::string text = HttpServer::formatResponse(response);
    EXPECT_EQ(text.compare(0, 22, "HTTP/1.1 409 Conflict\r"), 0);
    EXPECT_NE(text.find("Content-Length: 16\r\n"), std::string::npos);
    EXPECT_NE(text.find("Connection: close"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 16), "{\"error\":\"busy\"}");
}
