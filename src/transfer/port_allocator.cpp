#include "transfer/port_allocator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <stdexcept>

using json = nlohmann::json;

json PortLease::toJson() const {
    return {
        {"port", port},
        {"owner_job_id", ownerJobId},
        {"disk_index", diskIndex},
        {"leased_at", utils::formatTimestamp(leasedAt)}
    };
}

PortAllocator::PortAllocator(int minPort, int maxPort)
    : minPort_(minPort)
    , maxPort_(maxPort) {
    if (minPort <= 0 || maxPort > 65535 || minPort > maxPort) {
        throw std::invalid_argument("invalid port range " + std::to_string(minPort) +
                                    "-" + std::to_string(maxPort));
    }
    Logger::info("Port allocator managing " + std::to_string(totalPorts()) + " ports (" +
                 std::to_string(minPort_) + "-" + std::to_string(maxPort_) + ")");
}

int PortAllocator::allocate(const std::string& ownerJobId, int diskIndex) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Leases are ordered by port, so the first gap is the lowest free port
    int candidate = minPort_;
    for (const auto& entry : leases_) {
        if (entry.first != candidate) {
            break;
        }
        ++candidate;
    }

    if (candidate > maxPort_) {
        Logger::error("Port pool exhausted: all " + std::to_string(totalPorts()) +
                      " ports leased, request from job " + ownerJobId);
        throw BackupError(ErrorKind::POOL_EXHAUSTED,
                          "no free transfer port in range " + std::to_string(minPort_) + "-" +
                          std::to_string(maxPort_), ownerJobId);
    }

    leases_[candidate] = PortLease{candidate, ownerJobId, diskIndex, std::chrono::system_clock::now()};
    Logger::info("Leased port " + std::to_string(candidate) + " to job " + ownerJobId +
                 " disk " + std::to_string(diskIndex) + " (" + std::to_string(leases_.size()) +
                 "/" + std::to_string(totalPorts()) + " in use)");
    return candidate;
}

bool PortAllocator::release(int port) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = leases_.find(port);
    if (it == leases_.end()) {
        Logger::debug("Release of free port " + std::to_string(port) + " ignored");
        return false;
    }

    Logger::info("Released port " + std::to_string(port) + " from job " + it->second.ownerJobId);
    leases_.erase(it);
    return true;
}

size_t PortAllocator::releaseAll(const std::string& ownerJobId) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t released = 0;
    for (auto it = leases_.begin(); it != leases_.end();) {
        if (it->second.ownerJobId == ownerJobId) {
            it = leases_.erase(it);
            ++released;
        } else {
            ++it;
        }
    }

    if (released > 0) {
        Logger::info("Released " + std::to_string(released) + " ports from job " + ownerJobId);
    }
    return released;
}

std::vector<PortLease> PortAllocator::listLeased() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PortLease> leases;
    leases.reserve(leases_.size());
    for (const auto& entry : leases_) {
        leases.push_back(entry.second);
    }
    return leases;
}

std::vector<int> PortAllocator::getPortsForJob(const std::string& ownerJobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> ports;
    for (const auto& entry : leases_) {
        if (entry.second.ownerJobId == ownerJobId) {
            ports.push_back(entry.first);
        }
    }
    return ports;
}

bool PortAllocator::isLeased(int port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leases_.count(port) > 0;
}

size_t PortAllocator::totalPorts() const {
    return static_cast<size_t>(maxPort_ - minPort_ + 1);
}

size_t PortAllocator::allocatedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leases_.size();
}

size_t PortAllocator::availableCount() const {
    return totalPorts() - allocatedCount();
}

json PortAllocator::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = totalPorts();
    size_t allocated = leases_.size();
    return {
        {"total_ports", total},
        {"allocated_ports", allocated},
        {"available_ports", total - allocated},
        {"utilization_percent", total == 0 ? 0.0 : 100.0 * static_cast<double>(allocated) / static_cast<double>(total)},
        {"min_port", minPort_},
        {"max_port", maxPort_}
    };
}
