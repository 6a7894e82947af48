#pragma once

#include <string>
#include <nlohmann/json.hpp>

struct OrchestratorConfig {
    struct {
        std::string path = "/var/log/diskchain/diskchain.log";
        std::string level = "info";
    } log;

    std::string databasePath = "/var/lib/diskchain/catalog.db";

    struct {
        std::string root = "/backup/repository";
        bool verifyImages = false;
        std::string qemuImgBinary = "qemu-img";
    } repository;

    struct {
        int minPort = 10100;
        int maxPort = 10199;
    } ports;

    struct {
        std::string binary = "qemu-nbd";
        std::string bindAddress = "127.0.0.1";
        std::string advertiseHost = "127.0.0.1";  // host placed in target descriptors
        int sharedReaders = 10;
        int startupTimeoutMs = 10000;
        int stopGraceMs = 5000;
        int releaseDelayMs = 100;
        int healthIntervalSeconds = 5;
        std::string logDir;  // per-process output, discarded when empty
    } transfer;

    struct {
        int softThresholdSeconds = 60;
        int hardThresholdSeconds = 300;
        int sweepIntervalSeconds = 15;
    } telemetry;

    struct {
        std::string url = "http://127.0.0.1:9081";
        int timeoutSeconds = 30;
        std::string telemetryUrl;  // callback base handed to the agent
    } captureAgent;

    struct {
        std::string bindAddress = "0.0.0.0";
        int port = 8082;
        int workers = 8;
    } api;

    std::string inventoryPath = "/etc/diskchain/inventory.json";
    int workers = 0;  // 0 = hardware concurrency
    int reconcileIntervalSeconds = 60;

    // Missing keys keep their defaults. Throws std::runtime_error on type errors.
    static OrchestratorConfig fromJson(const nlohmann::json& doc);
    static OrchestratorConfig loadFromFile(const std::string& path);

    bool validate(std::string& error) const;
    nlohmann::json toJson() const;
};
