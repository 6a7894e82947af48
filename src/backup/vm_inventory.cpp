#include "backup/vm_inventory.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>

using json = nlohmann::json;

namespace {

// Hypervisor device keys for the first SCSI/SATA controller start at 2000
const int BASE_DISK_KEY = 2000;

} // namespace

JsonFileInventory::JsonFileInventory(const std::string& path)
    : path_(path) {
}

bool JsonFileInventory::resolveDisks(const std::string& vmIdentifier, std::vector<DiskInfo>& disks,
                                     std::string& error) {
    std::ifstream file(path_);
    if (!file.is_open()) {
        error = "cannot open inventory " + path_;
        return false;
    }

    try {
        json doc;
        file >> doc;

        for (const auto& vm : doc.at("vms")) {
            if (vm.value("identifier", "") != vmIdentifier) {
                continue;
            }

            disks.clear();
            std::set<int> seen;
            int position = 0;
            for (const auto& entry : vm.at("disks")) {
                DiskInfo disk;
                disk.diskIndex = entry.value("index", position);
                disk.diskKey = entry.contains("key") ?
                               (entry["key"].is_string() ? entry["key"].get<std::string>()
                                                         : std::to_string(entry["key"].get<int>())) :
                               std::to_string(BASE_DISK_KEY + disk.diskIndex);
                disk.sourcePath = entry.value("path", "");
                disk.capacityBytes = entry.value("capacity_bytes", static_cast<uint64_t>(0));
                if (!seen.insert(disk.diskIndex).second) {
                    error = "duplicate disk index " + std::to_string(disk.diskIndex) + " for VM " + vmIdentifier;
                    return false;
                }
                disks.push_back(disk);
                ++position;
            }

            std::sort(disks.begin(), disks.end(), [](const DiskInfo& a, const DiskInfo& b) {
                return a.diskIndex < b.diskIndex;
            });
            Logger::debug("Inventory lists " + std::to_string(disks.size()) + " disks for " + vmIdentifier);
            return true;
        }
    } catch (const json::exception& e) {
        error = "invalid inventory " + path_ + ": " + e.what();
        return false;
    }

    error = "VM " + vmIdentifier + " is not in the inventory";
    return false;
}
