#include "transfer/transfer_server_launcher.hpp"
#include "common/logger.hpp"
#include "common/process_utils.hpp"
#include <algorithm>

QemuNbdLauncher::QemuNbdLauncher(const std::string& binary)
    : binary_(binary) {
}

std::vector<std::string> QemuNbdLauncher::buildArguments(const TransferLaunchRequest& request) const {
    return {
        binary_,
        "--format=qcow2",
        "--export-name=" + request.exportName,
        "--port=" + std::to_string(request.port),
        "--bind=" + request.bindAddress,
        "--shared=" + std::to_string(request.sharedReaders),
        "--persistent",
        "--cache=writeback",
        request.imagePath
    };
}

pid_t QemuNbdLauncher::launch(const TransferLaunchRequest& request, std::string& error) {
    auto args = buildArguments(request);
    Logger::debug("Launching: " + process::joinArguments(args));
    return process::spawn(args, request.logPath, error);
}

bool QemuNbdLauncher::matchesCommandLine(const std::vector<std::string>& args, int port) const {
    if (args.empty()) {
        return false;
    }
    auto baseName = [](const std::string& path) {
        size_t slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    };
    if (baseName(args[0]) != baseName(binary_)) {
        return false;
    }
    const std::string portArg = "--port=" + std::to_string(port);
    return std::find(args.begin(), args.end(), portArg) != args.end();
}

bool QemuNbdLauncher::isServerProcess(pid_t pid, int port) const {
    return matchesCommandLine(process::readCommandLine(pid), port);
}
