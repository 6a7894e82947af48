#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/errors.hpp"

class BackupCoordinator;
class ChainManager;
class PortAllocator;
class TelemetryReceiver;
class TransferProcessManager;

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
};

struct ApiResponse {
    int status{200};
    nlohmann::json body;
};

// Maps REST routes onto the orchestration components. Routes are served
// both at the root and under /api/v1.
class ApiHandler {
public:
    ApiHandler(std::shared_ptr<BackupCoordinator> coordinator,
               std::shared_ptr<TelemetryReceiver> telemetry,
               std::shared_ptr<ChainManager> chains,
               std::shared_ptr<PortAllocator> ports,
               std::shared_ptr<TransferProcessManager> transfers);

    // Never throws; failures become error responses
    ApiResponse handle(const ApiRequest& request);

    static int statusForError(ErrorKind kind);
    static ApiResponse errorResponse(ErrorKind kind, const std::string& message,
                                     const std::string& jobId = "");

private:
    ApiResponse route(const ApiRequest& request, const std::vector<std::string>& segments);

    ApiResponse startBackup(const ApiRequest& request);
    ApiResponse getBackup(const std::string& jobId);
    ApiResponse listBackups(const ApiRequest& request);
    ApiResponse cancelBackup(const std::string& jobId);
    ApiResponse completeDisk(const std::string& jobId, const std::string& diskIndex, const ApiRequest& request);
    ApiResponse receiveTelemetry(const std::string& jobType, const std::string& jobId, const ApiRequest& request);
    ApiResponse getChain(const std::string& vmIdentifier, const std::string& diskIndex);
    ApiResponse removeLatestBackup(const std::string& vmIdentifier, const std::string& diskIndex);
    ApiResponse listPorts();
    ApiResponse listTransfers();
    ApiResponse health();

    static nlohmann::json parseBody(const ApiRequest& request);
    static int parseDiskIndex(const std::string& value);

    std::shared_ptr<BackupCoordinator> coordinator_;
    std::shared_ptr<TelemetryReceiver> telemetry_;
    std::shared_ptr<ChainManager> chains_;
    std::shared_ptr<PortAllocator> ports_;
    std::shared_ptr<TransferProcessManager> transfers_;
};
