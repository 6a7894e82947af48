#include "main/serve_main.hpp"
#include "api/api_handler.hpp"
#include "api/http_server.hpp"
#include "backup/backup_coordinator.hpp"
#include "backup/capture_agent_client.hpp"
#include "backup/vm_inventory.hpp"
#include "common/logger.hpp"
#include "common/orchestrator_config.hpp"
#include "common/parallel_task_manager.hpp"
#include "common/scheduler.hpp"
#include "storage/catalog_database.hpp"
#include "storage/catalog_repository.hpp"
#include "storage/chain_manager.hpp"
#include "storage/image_manager.hpp"
#include "telemetry/stale_job_detector.hpp"
#include "telemetry/telemetry_receiver.hpp"
#include "transfer/port_allocator.hpp"
#include "transfer/transfer_process_manager.hpp"
#include "transfer/transfer_server_launcher.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> shutdownRequested(false);

void handleSignal(int) {
    shutdownRequested = true;
}

struct CommonOptions {
    std::string configPath = kDefaultConfigPath;
    std::string logLevel;
    std::string vmIdentifier;
    int diskIndex = -1;
    std::string action;
    bool help = false;
};

bool parseOptions(int argc, char* argv[], CommonOptions& options, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::string& value) {
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!next(options.configPath)) return false;
        } else if (arg == "-l" || arg == "--log-level") {
            if (!next(options.logLevel)) return false;
        } else if (arg == "--vm") {
            if (!next(options.vmIdentifier)) return false;
        } else if (arg == "--disk") {
            std::string value;
            if (!next(value)) return false;
            try {
                options.diskIndex = std::stoi(value);
            } catch (const std::exception&) {
                error = "invalid disk index: " + value;
                return false;
            }
        } else if (options.action.empty() && arg[0] != '-') {
            options.action = arg;
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }
    return true;
}

bool loadConfig(const CommonOptions& options, OrchestratorConfig& config) {
    try {
        config = OrchestratorConfig::loadFromFile(options.configPath);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
    if (!options.logLevel.empty()) {
        config.log.level = options.logLevel;
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Error: invalid configuration: " << error << std::endl;
        return false;
    }

    LogLevel level = LogLevel::INFO;
    Logger::levelFromString(config.log.level, level);
    if (!Logger::initialize(config.log.path, level)) {
        std::cerr << "Failed to initialize logger at " << config.log.path << std::endl;
        return false;
    }
    return true;
}

std::shared_ptr<ChainManager> openChainManager(const OrchestratorConfig& config) {
    auto database = std::make_shared<CatalogDatabase>(config.databasePath);
    auto repository = std::make_shared<CatalogRepository>(database);
    auto images = std::make_shared<Qcow2ImageManager>(config.repository.qemuImgBinary);
    return std::make_shared<ChainManager>(repository, images, config.repository.root);
}

} // namespace

void printServeUsage() {
    std::cout << "Usage: diskchain serve [options]\n"
              << "Options:\n"
              << "  -h, --help            Show this help message\n"
              << "  -c, --config PATH     Configuration file (default " << kDefaultConfigPath << ")\n"
              << "  -l, --log-level LEVEL Override the configured log level\n";
}

void printChainUsage() {
    std::cout << "Usage: diskchain chain <show|validate|remove-latest> --vm VM --disk N [options]\n"
              << "Options:\n"
              << "  -h, --help            Show this help message\n"
              << "  -c, --config PATH     Configuration file (default " << kDefaultConfigPath << ")\n"
              << "  --vm VM               VM identifier\n"
              << "  --disk N              Disk index\n";
}

int serveMain(int argc, char* argv[]) {
    CommonOptions options;
    std::string error;
    if (!parseOptions(argc, argv, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        printServeUsage();
        return 1;
    }
    if (options.help) {
        printServeUsage();
        return 0;
    }

    OrchestratorConfig config;
    if (!loadConfig(options, config)) {
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        Logger::fatal("curl_global_init failed");
        return 1;
    }

    int rc = 0;
    try {
        Logger::info("Starting DiskChain orchestrator with configuration " + options.configPath);

        auto database = std::make_shared<CatalogDatabase>(config.databasePath);
        auto repository = std::make_shared<CatalogRepository>(database);
        auto images = std::make_shared<Qcow2ImageManager>(config.repository.qemuImgBinary);
        auto chains = std::make_shared<ChainManager>(repository, images, config.repository.root);
        chains->setChecksumEnabled(config.repository.verifyImages);

        auto ports = std::make_shared<PortAllocator>(config.ports.minPort, config.ports.maxPort);

        TransferManagerOptions transferOptions;
        transferOptions.bindAddress = config.transfer.bindAddress;
        transferOptions.startupTimeout = std::chrono::milliseconds(config.transfer.startupTimeoutMs);
        transferOptions.stopGrace = std::chrono::milliseconds(config.transfer.stopGraceMs);
        transferOptions.releaseDelay = std::chrono::milliseconds(config.transfer.releaseDelayMs);
        transferOptions.logDir = config.transfer.logDir;
        auto transfers = std::make_shared<TransferProcessManager>(
            std::make_shared<QemuNbdLauncher>(config.transfer.binary), transferOptions);

        auto inventory = std::make_shared<JsonFileInventory>(config.inventoryPath);
        auto captureAgent = std::make_shared<HttpCaptureAgentClient>(config.captureAgent.url,
                                                                     config.captureAgent.timeoutSeconds);

        size_t workers = config.workers > 0 ? static_cast<size_t>(config.workers)
                                            : std::max(2u, std::thread::hardware_concurrency());
        auto taskManager = std::make_shared<ParallelTaskManager>(workers, "provisioning");

        CoordinatorOptions coordinatorOptions;
        coordinatorOptions.advertiseHost = config.transfer.advertiseHost;
        coordinatorOptions.sharedReaders = config.transfer.sharedReaders;
        coordinatorOptions.verifyImages = config.repository.verifyImages;
        coordinatorOptions.telemetryUrl = config.captureAgent.telemetryUrl;

        auto coordinator = std::make_shared<BackupCoordinator>(ports, transfers, chains, repository, inventory,
                                                               captureAgent, taskManager, coordinatorOptions);
        std::weak_ptr<BackupCoordinator> weakCoordinator = coordinator;
        transfers->setFailureCallback([weakCoordinator](const TransferProcess& process) {
            if (auto c = weakCoordinator.lock()) {
                c->onTransferFailure(process);
            }
        });

        size_t recovered = coordinator->recoverInterruptedJobs();
        if (recovered > 0) {
            Logger::warning("Recovered " + std::to_string(recovered) + " jobs interrupted by a previous run");
        }

        auto telemetry = std::make_shared<TelemetryReceiver>(coordinator);
        StaleThresholds thresholds;
        thresholds.soft = std::chrono::seconds(config.telemetry.softThresholdSeconds);
        thresholds.hard = std::chrono::seconds(config.telemetry.hardThresholdSeconds);
        auto staleDetector = std::make_shared<StaleJobDetector>(coordinator, thresholds);

        Scheduler scheduler;
        scheduler.schedulePeriodicTask("transfer-health",
                                       std::chrono::seconds(config.transfer.healthIntervalSeconds),
                                       [transfers]() { transfers->sweep(); });
        scheduler.schedulePeriodicTask("stale-jobs",
                                       std::chrono::seconds(config.telemetry.sweepIntervalSeconds),
                                       [staleDetector]() { staleDetector->sweepStaleJobs(); });
        scheduler.schedulePeriodicTask("reconcile",
                                       std::chrono::seconds(config.reconcileIntervalSeconds),
                                       [coordinator]() { coordinator->reconcileResources(); });
        scheduler.start();

        auto handler = std::make_shared<ApiHandler>(coordinator, telemetry, chains, ports, transfers);
        HttpServer server(handler, config.api.bindAddress, config.api.port,
                          static_cast<size_t>(config.api.workers));
        if (!server.start(error)) {
            Logger::fatal("Failed to start API server: " + error);
            scheduler.stop();
            curl_global_cleanup();
            return 1;
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
        while (!shutdownRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        Logger::info("Shutdown requested");
        server.stop();
        scheduler.stop();
        for (const auto& job : coordinator->getActiveJobs()) {
            coordinator->failJob(job->getId(), ErrorKind::CANCELLED, "orchestrator shutting down");
        }
        taskManager->shutdown();
        transfers->stopAll();
    } catch (const std::exception& e) {
        Logger::fatal(std::string("Orchestrator failed: ") + e.what());
        rc = 1;
    }

    curl_global_cleanup();
    Logger::info("DiskChain orchestrator stopped");
    Logger::shutdown();
    return rc;
}

int chainMain(int argc, char* argv[]) {
    CommonOptions options;
    std::string error;
    if (!parseOptions(argc, argv, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        printChainUsage();
        return 1;
    }
    if (options.help) {
        printChainUsage();
        return 0;
    }
    if (options.action.empty() || options.vmIdentifier.empty() || options.diskIndex < 0) {
        std::cerr << "Error: action, --vm and --disk are required" << std::endl;
        printChainUsage();
        return 1;
    }

    OrchestratorConfig config;
    if (!loadConfig(options, config)) {
        return 1;
    }

    try {
        auto chains = openChainManager(config);
        BackupChain chain;
        if (!chains->getChain(options.vmIdentifier, options.diskIndex, chain)) {
            std::cerr << "No chain for " << options.vmIdentifier << " disk " << options.diskIndex << std::endl;
            return 1;
        }

        if (options.action == "show") {
            nlohmann::json doc = chain.toJson();
            doc["backups"] = nlohmann::json::array();
            for (const auto& backup : chains->listBackups(options.vmIdentifier, options.diskIndex)) {
                doc["backups"].push_back(backup.toJson());
            }
            std::cout << doc.dump(2) << std::endl;
            return 0;
        }
        if (options.action == "validate") {
            if (!chains->validateChain(options.vmIdentifier, options.diskIndex, error)) {
                std::cerr << "Chain is invalid: " << error << std::endl;
                return 1;
            }
            std::cout << "Chain is valid: " << chain.totalBackups << " backups" << std::endl;
            return 0;
        }
        if (options.action == "remove-latest") {
            // A running server may still commit onto this tail
            for (const auto& job : chains->getRepository()->listUnfinishedJobs()) {
                if (job.vmIdentifier == options.vmIdentifier) {
                    std::cerr << "Error: backup job " << job.jobId << " is in progress for "
                              << options.vmIdentifier << std::endl;
                    return 1;
                }
            }
            if (!chains->removeLatestBackup(options.vmIdentifier, options.diskIndex, error)) {
                std::cerr << "Error: " << error << std::endl;
                return 1;
            }
            std::cout << "Removed backup " << chain.latestBackupId << std::endl;
            return 0;
        }

        std::cerr << "Error: unknown chain action: " << options.action << std::endl;
        printChainUsage();
        return 1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Chain command failed: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
