#include "common/orchestrator_config.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template<typename T>
void readValue(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const json& sectionOf(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    if (it == doc.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

} // namespace

OrchestratorConfig OrchestratorConfig::fromJson(const json& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("configuration root must be a JSON object");
    }

    OrchestratorConfig config;
    try {
        const json& log = sectionOf(doc, "log");
        readValue(log, "path", config.log.path);
        readValue(log, "level", config.log.level);

        readValue(sectionOf(doc, "database"), "path", config.databasePath);

        const json& repository = sectionOf(doc, "repository");
        readValue(repository, "root", config.repository.root);
        readValue(repository, "verify_images", config.repository.verifyImages);
        readValue(repository, "qemu_img_binary", config.repository.qemuImgBinary);

        const json& ports = sectionOf(doc, "ports");
        readValue(ports, "min", config.ports.minPort);
        readValue(ports, "max", config.ports.maxPort);

        const json& transfer = sectionOf(doc, "transfer");
        readValue(transfer, "binary", config.transfer.binary);
        readValue(transfer, "bind_address", config.transfer.bindAddress);
        readValue(transfer, "advertise_host", config.transfer.advertiseHost);
        readValue(transfer, "shared_readers", config.transfer.sharedReaders);
        readValue(transfer, "startup_timeout_ms", config.transfer.startupTimeoutMs);
        readValue(transfer, "stop_grace_ms", config.transfer.stopGraceMs);
        readValue(transfer, "release_delay_ms", config.transfer.releaseDelayMs);
        readValue(transfer, "health_interval_s", config.transfer.healthIntervalSeconds);
        readValue(transfer, "log_dir", config.transfer.logDir);

        const json& telemetry = sectionOf(doc, "telemetry");
        readValue(telemetry, "soft_threshold_s", config.telemetry.softThresholdSeconds);
        readValue(telemetry, "hard_threshold_s", config.telemetry.hardThresholdSeconds);
        readValue(telemetry, "sweep_interval_s", config.telemetry.sweepIntervalSeconds);

        const json& agent = sectionOf(doc, "capture_agent");
        readValue(agent, "url", config.captureAgent.url);
        readValue(agent, "timeout_s", config.captureAgent.timeoutSeconds);
        readValue(agent, "telemetry_url", config.captureAgent.telemetryUrl);

        const json& api = sectionOf(doc, "api");
        readValue(api, "bind_address", config.api.bindAddress);
        readValue(api, "port", config.api.port);
        readValue(api, "workers", config.api.workers);

        readValue(sectionOf(doc, "inventory"), "path", config.inventoryPath);
        readValue(doc, "workers", config.workers);
        readValue(doc, "reconcile_interval_s", config.reconcileIntervalSeconds);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid configuration value: ") + e.what());
    }

    return config;
}

OrchestratorConfig OrchestratorConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open configuration file: " + path);
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("cannot parse configuration file " + path + ": " + e.what());
    }

    OrchestratorConfig config = fromJson(doc);
    Logger::debug("Loaded configuration from " + path);
    return config;
}

bool OrchestratorConfig::validate(std::string& error) const {
    if (ports.minPort <= 0 || ports.maxPort > 65535 || ports.minPort > ports.maxPort) {
        error = "invalid port range " + std::to_string(ports.minPort) + "-" + std::to_string(ports.maxPort);
        return false;
    }
    if (api.port >= ports.minPort && api.port <= ports.maxPort) {
        error = "api port " + std::to_string(api.port) + " overlaps the transfer port range";
        return false;
    }
    if (telemetry.softThresholdSeconds <= 0 ||
        telemetry.hardThresholdSeconds <= telemetry.softThresholdSeconds) {
        error = "telemetry hard threshold must be greater than the soft threshold";
        return false;
    }
    if (telemetry.sweepIntervalSeconds <= 0 || transfer.healthIntervalSeconds <= 0 ||
        reconcileIntervalSeconds <= 0) {
        error = "sweep intervals must be positive";
        return false;
    }
    if (transfer.sharedReaders <= 0) {
        error = "transfer.shared_readers must be positive";
        return false;
    }
    if (transfer.startupTimeoutMs <= 0 || transfer.stopGraceMs < 0 || transfer.releaseDelayMs < 0) {
        error = "invalid transfer timeouts";
        return false;
    }
    if (repository.root.empty() || databasePath.empty()) {
        error = "repository.root and database.path are required";
        return false;
    }
    if (captureAgent.url.empty()) {
        error = "capture_agent.url is required";
        return false;
    }
    LogLevel level;
    if (!Logger::levelFromString(log.level, level)) {
        error = "unknown log level: " + log.level;
        return false;
    }
    return true;
}

json OrchestratorConfig::toJson() const {
    return {
        {"log", {{"path", log.path}, {"level", log.level}}},
        {"database", {{"path", databasePath}}},
        {"repository", {
            {"root", repository.root},
            {"verify_images", repository.verifyImages},
            {"qemu_img_binary", repository.qemuImgBinary}
        }},
        {"ports", {{"min", ports.minPort}, {"max", ports.maxPort}}},
        {"transfer", {
            {"binary", transfer.binary},
            {"bind_address", transfer.bindAddress},
            {"advertise_host", transfer.advertiseHost},
            {"shared_readers", transfer.sharedReaders},
            {"startup_timeout_ms", transfer.startupTimeoutMs},
            {"stop_grace_ms", transfer.stopGraceMs},
            {"release_delay_ms", transfer.releaseDelayMs},
            {"health_interval_s", transfer.healthIntervalSeconds},
            {"log_dir", transfer.logDir}
        }},
        {"telemetry", {
            {"soft_threshold_s", telemetry.softThresholdSeconds},
            {"hard_threshold_s", telemetry.hardThresholdSeconds},
            {"sweep_interval_s", telemetry.sweepIntervalSeconds}
        }},
        {"capture_agent", {
            {"url", captureAgent.url},
            {"timeout_s", captureAgent.timeoutSeconds},
            {"telemetry_url", captureAgent.telemetryUrl}
        }},
        {"api", {{"bind_address", api.bindAddress}, {"port", api.port}, {"workers", api.workers}}},
        {"inventory", {{"path", inventoryPath}}},
        {"workers", workers},
        {"reconcile_interval_s", reconcileIntervalSeconds}
    };
}
