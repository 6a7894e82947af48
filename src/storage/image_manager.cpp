#include "storage/image_manager.hpp"
#include "common/logger.hpp"
#include "common/process_utils.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool ImageManager::remove(const std::string& path, std::string& error) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        error = "failed to remove " + path + ": " + ec.message();
        return false;
    }
    std::filesystem::remove(path + ".json", ec);
    return true;
}

bool ImageManager::exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

Qcow2ImageManager::Qcow2ImageManager(const std::string& qemuImgBinary)
    : qemuImg_(qemuImgBinary) {
}

bool Qcow2ImageManager::run(const std::vector<std::string>& args, std::string& output, std::string& error) {
    Logger::debug("Running: " + process::joinArguments(args));

    CommandResult result;
    if (!process::runCommand(args, result, error)) {
        return false;
    }
    output = result.output;
    if (result.exitCode != 0) {
        error = args[0] + " " + args[1] + " exited with code " + std::to_string(result.exitCode) +
                ": " + utils::trim(result.output);
        return false;
    }
    return true;
}

bool Qcow2ImageManager::ensureParentDirectory(const std::string& path, std::string& error) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            error = "failed to create directory " + dir.string() + ": " + ec.message();
            return false;
        }
    }
    return true;
}

bool Qcow2ImageManager::createFull(const std::string& path, uint64_t sizeBytes, std::string& error) {
    if (exists(path)) {
        error = "image already exists: " + path;
        return false;
    }
    if (sizeBytes == 0) {
        error = "refusing to create zero-sized image " + path;
        return false;
    }
    if (!ensureParentDirectory(path, error)) {
        return false;
    }

    std::string output;
    if (!run({qemuImg_, "create", "-f", "qcow2", path, std::to_string(sizeBytes)}, output, error)) {
        return false;
    }
    Logger::info("Created full image " + path + " (" + std::to_string(sizeBytes) + " bytes)");
    return true;
}

bool Qcow2ImageManager::createIncremental(const std::string& path, const std::string& backingPath,
                                          std::string& error) {
    if (!exists(backingPath)) {
        error = "backing image does not exist: " + backingPath;
        return false;
    }
    if (exists(path)) {
        error = "image already exists: " + path;
        return false;
    }
    if (!ensureParentDirectory(path, error)) {
        return false;
    }

    std::string output;
    if (!run({qemuImg_, "create", "-f", "qcow2", "-b", backingPath, "-F", "qcow2", path}, output, error)) {
        return false;
    }
    Logger::info("Created incremental image " + path + " backed by " + backingPath);
    return true;
}

bool Qcow2ImageManager::getInfo(const std::string& path, ImageInfo& info, std::string& error) {
    std::string output;
    if (!run({qemuImg_, "info", "--output=json", "-U", path}, output, error)) {
        return false;
    }
    if (!parseInfo(output, info, error)) {
        return false;
    }
    info.path = path;
    return true;
}

bool Qcow2ImageManager::check(const std::string& path, std::string& error) {
    std::string output;
    if (!run({qemuImg_, "check", "-f", "qcow2", path}, output, error)) {
        return false;
    }
    Logger::debug("Image check passed for " + path);
    return true;
}

bool Qcow2ImageManager::parseInfo(const std::string& jsonText, ImageInfo& info, std::string& error) {
    try {
        json doc = json::parse(jsonText);
        info.format = doc.value("format", "");
        info.virtualSize = doc.value("virtual-size", static_cast<uint64_t>(0));
        info.actualSize = doc.value("actual-size", static_cast<uint64_t>(0));
        info.dirty = doc.value("dirty-flag", false);
        // full-backing-filename is absolute even when the image stores a relative path
        info.backingFile = doc.value("full-backing-filename", doc.value("backing-filename", ""));
        return true;
    } catch (const json::exception& e) {
        error = std::string("cannot parse qemu-img info output: ") + e.what();
        return false;
    }
}
