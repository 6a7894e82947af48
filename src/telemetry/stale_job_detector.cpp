#include "telemetry/stale_job_detector.hpp"
#include "backup/backup_coordinator.hpp"
#include "common/logger.hpp"
#include <stdexcept>

StaleJobDetector::StaleJobDetector(std::shared_ptr<BackupCoordinator> coordinator, StaleThresholds thresholds)
    : coordinator_(std::move(coordinator))
    , thresholds_(thresholds) {
    if (!coordinator_) {
        throw std::invalid_argument("stale job detector needs a coordinator");
    }
    if (thresholds_.hard <= thresholds_.soft) {
        throw std::invalid_argument("hard stale threshold must exceed the soft threshold");
    }
}

StaleSweepResult StaleJobDetector::sweepStaleJobs(TimePoint now) {
    StaleSweepResult result;

    for (const auto& job : coordinator_->getActiveJobs()) {
        if (job->isFinalizing()) {
            continue;
        }
        BackupJobRecord record = job->snapshot();
        if (record.phase != JobPhase::AWAITING_COMPLETION) {
            continue;
        }

        TimePoint lastSeen = record.lastTelemetryAt != TimePoint{} ? record.lastTelemetryAt : record.startedAt;
        auto silence = std::chrono::duration_cast<std::chrono::seconds>(now - lastSeen);

        if (silence > thresholds_.hard) {
            std::string message = "no telemetry for " + std::to_string(silence.count()) + "s";
            Logger::error("Job " + record.jobId + " is stale: " + message);
            if (coordinator_->failJob(record.jobId, ErrorKind::STALE_JOB, message)) {
                ++result.failed;
            }
        } else if (silence > thresholds_.soft && record.status == JobStatus::RUNNING) {
            bool marked = false;
            job->modify([&](BackupJobRecord& r) {
                // Telemetry may have landed since the snapshot
                if (r.status == JobStatus::RUNNING && r.lastTelemetryAt == record.lastTelemetryAt) {
                    r.status = JobStatus::STALLED;
                    marked = true;
                }
            });
            if (marked) {
                Logger::warning("Job " + record.jobId + " stalled: no telemetry for " +
                                std::to_string(silence.count()) + "s");
                coordinator_->persist(*job);
                ++result.stalled;
            }
        }
    }
    return result;
}
