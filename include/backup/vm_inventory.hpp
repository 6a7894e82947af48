#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct DiskInfo {
    int diskIndex{0};
    std::string diskKey;      // hypervisor device key understood by the capture agent
    std::string sourcePath;
    uint64_t capacityBytes{0};
};

// Disk layout of source VMs
class VmInventory {
public:
    virtual ~VmInventory() = default;

    // Disks ordered by index; false with error when the VM is unknown
    virtual bool resolveDisks(const std::string& vmIdentifier, std::vector<DiskInfo>& disks,
                              std::string& error) = 0;
};

// Reads {"vms": [{"identifier": ..., "disks": [{"index", "key", "path", "capacity_bytes"}]}]}
// on every lookup so edits apply without a restart.
class JsonFileInventory : public VmInventory {
public:
    explicit JsonFileInventory(const std::string& path);

    bool resolveDisks(const std::string& vmIdentifier, std::vector<DiskInfo>& disks,
                      std::string& error) override;

private:
    std::string path_;
};
