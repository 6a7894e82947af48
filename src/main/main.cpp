#include "main/serve_main.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

#ifndef DISKCHAIN_VERSION
#define DISKCHAIN_VERSION "1.0.0"
#endif

void printUsage() {
    std::cout << "Usage: diskchain [command] [options]\n"
              << "Commands:\n"
              << "  serve     - Run the backup orchestrator\n"
              << "  chain     - Inspect or maintain backup chains\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help    Show this help message\n"
              << "  -v, --version Show version information\n";
}

int main(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage();
        return 0;
    }

    if (argc > 1 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "diskchain version " << DISKCHAIN_VERSION << "\n";
        return 0;
    }

    if (argc < 2) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return 1;
    }

    std::string command = argv[1];
    try {
        if (command == "serve") {
            return serveMain(argc - 1, argv + 1);
        } else if (command == "chain") {
            return chainMain(argc - 1, argv + 1);
        } else {
            std::cerr << "Error: Unknown command: " << command << std::endl;
            printUsage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
