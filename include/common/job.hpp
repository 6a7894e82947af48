#pragma once

#include <string>
#include <functional>
#include <mutex>
#include "common/backup_status.hpp"

using StatusCallback = std::function<void(const std::string& jobId, JobStatus status)>;

class Job {
public:
    Job();
    virtual ~Job() = default;

    std::string getId() const;
    virtual JobStatus getStatus() const = 0;
    virtual std::string getError() const = 0;
    bool isTerminal() const { return ::isTerminal(getStatus()); }

    void setStatusCallback(StatusCallback callback);

protected:
    // Must be called without mutex_ held
    void notifyStatus(JobStatus status);
    void setId(const std::string& id);
    static std::string generateId();

    std::string id_;
    StatusCallback statusCallback_;
    mutable std::mutex mutex_;
};
