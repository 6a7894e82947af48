#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/utils.hpp"

struct PortLease {
    int port{0};
    std::string ownerJobId;
    int diskIndex{0};
    TimePoint leasedAt{};

    nlohmann::json toJson() const;
};

// Fixed contiguous range of ports leased to backup jobs, one lease per port.
class PortAllocator {
public:
    static constexpr int DEFAULT_MIN_PORT = 10100;
    static constexpr int DEFAULT_MAX_PORT = 10199;

    // Throws std::invalid_argument on an empty or out-of-range span
    PortAllocator(int minPort = DEFAULT_MIN_PORT, int maxPort = DEFAULT_MAX_PORT);

    // Lowest free port. Throws BackupError(POOL_EXHAUSTED) when none is left.
    int allocate(const std::string& ownerJobId, int diskIndex);

    // Releasing a free port is a no-op; returns whether a lease was removed
    bool release(int port);

    // Drops every lease of the owner in one step; returns the number released
    size_t releaseAll(const std::string& ownerJobId);

    std::vector<PortLease> listLeased() const;
    std::vector<int> getPortsForJob(const std::string& ownerJobId) const;
    bool isLeased(int port) const;

    int minPort() const { return minPort_; }
    int maxPort() const { return maxPort_; }
    size_t totalPorts() const;
    size_t allocatedCount() const;
    size_t availableCount() const;

    nlohmann::json getMetrics() const;

private:
    int minPort_;
    int maxPort_;
    std::map<int, PortLease> leases_;
    mutable std::mutex mutex_;
};
