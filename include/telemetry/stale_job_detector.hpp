#pragma once

#include <chrono>
#include <memory>
#include "common/utils.hpp"

class BackupCoordinator;

struct StaleThresholds {
    std::chrono::seconds soft{60};
    std::chrono::seconds hard{300};
};

struct StaleSweepResult {
    size_t stalled{0};
    size_t failed{0};
};

// Marks silent jobs stalled after the soft threshold and fails them after
// the hard one. Only jobs waiting on the capture agent are considered.
class StaleJobDetector {
public:
    StaleJobDetector(std::shared_ptr<BackupCoordinator> coordinator, StaleThresholds thresholds);

    StaleSweepResult sweepStaleJobs(TimePoint now = std::chrono::system_clock::now());

    const StaleThresholds& getThresholds() const { return thresholds_; }

private:
    std::shared_ptr<BackupCoordinator> coordinator_;
    StaleThresholds thresholds_;
};
