#include "api/api_handler.hpp"
#include "backup/backup_coordinator.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "storage/chain_manager.hpp"
#include "telemetry/telemetry_receiver.hpp"
#include "transfer/port_allocator.hpp"
#include "transfer/transfer_process_manager.hpp"

using json = nlohmann::json;

namespace {

const char* const kApiPrefix = "/api/v1";

std::vector<std::string> pathSegments(const std::string& path) {
    std::vector<std::string> segments;
    for (const auto& part : utils::split(path, '/')) {
        if (!part.empty()) {
            segments.push_back(utils::urlDecode(part));
        }
    }
    return segments;
}

} // namespace

ApiHandler::ApiHandler(std::shared_ptr<BackupCoordinator> coordinator,
                       std::shared_ptr<TelemetryReceiver> telemetry,
                       std::shared_ptr<ChainManager> chains,
                       std::shared_ptr<PortAllocator> ports,
                       std::shared_ptr<TransferProcessManager> transfers)
    : coordinator_(std::move(coordinator))
    , telemetry_(std::move(telemetry))
    , chains_(std::move(chains))
    , ports_(std::move(ports))
    , transfers_(std::move(transfers)) {
}

int ApiHandler::statusForError(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_REQUEST: return 400;
        case ErrorKind::NOT_FOUND: return 404;
        case ErrorKind::PARENT_BACKUP_MISSING: return 409;
        case ErrorKind::BACKUP_IN_PROGRESS: return 409;
        case ErrorKind::POOL_EXHAUSTED: return 503;
        case ErrorKind::CAPTURE_AGENT_UNREACHABLE: return 502;
        case ErrorKind::CAPTURE_AGENT_ERROR: return 502;
        default: return 500;
    }
}

ApiResponse ApiHandler::errorResponse(ErrorKind kind, const std::string& message, const std::string& jobId) {
    ApiResponse response;
    response.status = statusForError(kind);
    response.body = {
        {"error", message},
        {"error_kind", errorKindToString(kind)}
    };
    if (!jobId.empty()) {
        response.body["job_id"] = jobId;
    }
    return response;
}

ApiResponse ApiHandler::handle(const ApiRequest& request) {
    std::string path = request.path;
    const std::string prefix = kApiPrefix;
    if (path.compare(0, prefix.size(), prefix) == 0 &&
        (path.size() == prefix.size() || path[prefix.size()] == '/')) {
        path = path.substr(prefix.size());
    }

    ApiResponse response;
    try {
        response = route(request, pathSegments(path));
    } catch (const BackupError& e) {
        response = errorResponse(e.kind(), e.what(), e.jobId());
    } catch (const json::exception& e) {
        response = errorResponse(ErrorKind::INVALID_REQUEST, std::string("invalid JSON: ") + e.what());
    } catch (const std::exception& e) {
        Logger::error("Unhandled error on " + request.method + " " + request.path + ": " + e.what());
        response = errorResponse(ErrorKind::INTERNAL, e.what());
    }

    Logger::debug(request.method + " " + request.path + " -> " + std::to_string(response.status));
    return response;
}

ApiResponse ApiHandler::route(const ApiRequest& request, const std::vector<std::string>& segments) {
    const std::string& method = request.method;
    const size_t n = segments.size();

    if (n >= 1 && segments[0] == "backups") {
        if (n == 1 && method == "POST") return startBackup(request);
        if (n == 1 && method == "GET") return listBackups(request);
        if (n == 2 && method == "GET") return getBackup(segments[1]);
        if (n == 3 && method == "POST" && segments[2] == "cancel") return cancelBackup(segments[1]);
        if (n == 5 && method == "POST" && segments[2] == "disks" && segments[4] == "complete") {
            return completeDisk(segments[1], segments[3], request);
        }
    } else if (n == 3 && segments[0] == "telemetry" && method == "POST") {
        return receiveTelemetry(segments[1], segments[2], request);
    } else if (n >= 3 && segments[0] == "chains") {
        if (n == 3 && method == "GET") return getChain(segments[1], segments[2]);
        if (n == 4 && method == "DELETE" && segments[3] == "latest") {
            return removeLatestBackup(segments[1], segments[2]);
        }
    } else if (n == 1 && method == "GET") {
        if (segments[0] == "ports") return listPorts();
        if (segments[0] == "transfers") return listTransfers();
        if (segments[0] == "health") return health();
    }

    return errorResponse(ErrorKind::NOT_FOUND, "no route for " + method + " " + request.path);
}

json ApiHandler::parseBody(const ApiRequest& request) {
    if (request.body.empty()) {
        return json::object();
    }
    json body = json::parse(request.body);
    if (!body.is_object()) {
        throw BackupError(ErrorKind::INVALID_REQUEST, "request body must be a JSON object");
    }
    return body;
}

int ApiHandler::parseDiskIndex(const std::string& value) {
    try {
        size_t consumed = 0;
        int index = std::stoi(value, &consumed);
        if (consumed == value.size() && index >= 0) {
            return index;
        }
    } catch (const std::exception&) {
        // falls through to the error below
    }
    throw BackupError(ErrorKind::INVALID_REQUEST, "invalid disk index: " + value);
}

ApiResponse ApiHandler::startBackup(const ApiRequest& request) {
    json body = parseBody(request);
    std::string vmIdentifier = body.value("vm_identifier", "");
    std::string typeName = body.value("backup_type", "full");
    if (vmIdentifier.empty()) {
        throw BackupError(ErrorKind::INVALID_REQUEST, "vm_identifier is required");
    }

    BackupType type;
    if (!backupTypeFromString(typeName, type)) {
        throw BackupError(ErrorKind::INVALID_REQUEST, "backup_type must be full or incremental");
    }

    BackupJobRecord job = coordinator_->startBackup(vmIdentifier, type);

    ApiResponse response;
    response.status = 201;
    response.body = job.toJson();
    response.body["combined_target_descriptor"] = job.targetDescriptor;
    return response;
}

ApiResponse ApiHandler::getBackup(const std::string& jobId) {
    BackupJobRecord job;
    if (!coordinator_->getJob(jobId, job)) {
        return errorResponse(ErrorKind::NOT_FOUND, "unknown job " + jobId, jobId);
    }
    ApiResponse response;
    response.body = job.toJson();
    return response;
}

ApiResponse ApiHandler::listBackups(const ApiRequest& request) {
    std::string vmIdentifier;
    auto it = request.query.find("vm_identifier");
    if (it != request.query.end()) {
        vmIdentifier = it->second;
    }

    json jobs = json::array();
    for (const auto& job : coordinator_->listJobs(vmIdentifier)) {
        jobs.push_back(job.toJson());
    }
    ApiResponse response;
    response.body = {{"jobs", jobs}, {"count", jobs.size()}};
    return response;
}

ApiResponse ApiHandler::cancelBackup(const std::string& jobId) {
    ApiResponse response;
    response.body = coordinator_->cancelBackup(jobId).toJson();
    return response;
}

ApiResponse ApiHandler::completeDisk(const std::string& jobId, const std::string& diskIndex,
                                     const ApiRequest& request) {
    json body = parseBody(request);
    int index = parseDiskIndex(diskIndex);
    std::string changeId = body.value("change_id", "");
    uint64_t bytes = body.value("bytes_transferred", static_cast<uint64_t>(0));

    bool applied = telemetry_->completeDisk(jobId, index, changeId, bytes);
    ApiResponse response;
    response.body = {{"status", "ok"}, {"applied", applied}};
    return response;
}

ApiResponse ApiHandler::receiveTelemetry(const std::string& jobType, const std::string& jobId,
                                         const ApiRequest& request) {
    TelemetryUpdate update = TelemetryUpdate::fromJson(parseBody(request));
    size_t applied = telemetry_->receiveJobUpdate(jobType, jobId, update);
    ApiResponse response;
    response.body = {{"status", "ok"}, {"applied_disks", applied}};
    return response;
}

ApiResponse ApiHandler::getChain(const std::string& vmIdentifier, const std::string& diskIndex) {
    int index = parseDiskIndex(diskIndex);
    BackupChain chain;
    if (!chains_->getChain(vmIdentifier, index, chain)) {
        return errorResponse(ErrorKind::NOT_FOUND, "no chain for " + vmIdentifier + " disk " + diskIndex);
    }

    json backups = json::array();
    for (const auto& backup : chains_->listBackups(vmIdentifier, index)) {
        backups.push_back(backup.toJson());
    }

    std::string error;
    bool valid = chains_->validateChain(vmIdentifier, index, error);

    ApiResponse response;
    response.body = chain.toJson();
    response.body["backups"] = backups;
    response.body["valid"] = valid;
    if (!valid) {
        response.body["validation_error"] = error;
    }
    return response;
}

ApiResponse ApiHandler::removeLatestBackup(const std::string& vmIdentifier, const std::string& diskIndex) {
    int index = parseDiskIndex(diskIndex);
    BackupChain chain;
    if (!chains_->getChain(vmIdentifier, index, chain)) {
        return errorResponse(ErrorKind::NOT_FOUND, "no chain for " + vmIdentifier + " disk " + diskIndex);
    }

    // The running job may commit onto this tail
    std::string runningJob = coordinator_->activeJobForVm(vmIdentifier);
    if (!runningJob.empty()) {
        return errorResponse(ErrorKind::BACKUP_IN_PROGRESS,
                             "backup job " + runningJob + " is running for VM " + vmIdentifier);
    }

    std::string error;
    if (!chains_->removeLatestBackup(vmIdentifier, index, error)) {
        return errorResponse(ErrorKind::INVALID_REQUEST, error);
    }

    ApiResponse response;
    response.body = {{"status", "ok"}, {"removed_backup_id", chain.latestBackupId}};
    return response;
}

ApiResponse ApiHandler::listPorts() {
    json leases = json::array();
    for (const auto& lease : ports_->listLeased()) {
        leases.push_back(lease.toJson());
    }
    ApiResponse response;
    response.body = ports_->getMetrics();
    response.body["leases"] = leases;
    return response;
}

ApiResponse ApiHandler::listTransfers() {
    json processes = json::array();
    for (const auto& process : transfers_->listProcesses()) {
        processes.push_back(process.toJson());
    }
    ApiResponse response;
    response.body = {{"transfers", processes}, {"count", processes.size()}};
    return response;
}

ApiResponse ApiHandler::health() {
    ApiResponse response;
    response.body = {
        {"status", "ok"},
        {"active_jobs", coordinator_->getActiveJobs().size()},
        {"transfer_processes", transfers_->getProcessCount()},
        {"ports", ports_->getMetrics()}
    };
    return response;
}
