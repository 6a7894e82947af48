#include "common/job.hpp"
#include "common/utils.hpp"

Job::Job() = default;

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

void Job::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    statusCallback_ = std::move(callback);
}

void Job::notifyStatus(JobStatus status) {
    StatusCallback callback;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = statusCallback_;
        id = id_;
    }
    if (callback) {
        callback(id, status);
    }
}

void Job::setId(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    id_ = id;
}

std::string Job::generateId() {
    return utils::generateId("job-");
}
