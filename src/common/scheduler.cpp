#include "common/scheduler.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <vector>

Scheduler::Scheduler()
    : running_(false) {
}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::schedulePeriodicTask(const std::string& taskId,
                                     std::chrono::seconds interval,
                                     TaskCallback callback) {
    if (interval.count() <= 0 || !callback) {
        Logger::error("Refusing to schedule task " + taskId + " with invalid interval or callback");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        tasks_[taskId] = Task{Clock::now() + interval, interval, std::move(callback)};
        ++generation_;
    }
    condition_.notify_one();
    Logger::debug("Scheduled task " + taskId + " every " + std::to_string(interval.count()) + "s");
    return true;
}

bool Scheduler::cancelTask(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    ++generation_;
    return tasks_.erase(taskId) > 0;
}

void Scheduler::start() {
    bool expected = false;
    if (running_.compare_exchange_strong(expected, true)) {
        schedulerThread_ = std::thread(&Scheduler::schedulerLoop, this);
    }
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        running_ = false;
    }
    condition_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
}

void Scheduler::processTasks() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    auto now = Clock::now();

    std::vector<std::pair<std::string, Task>> due;
    for (auto& entry : tasks_) {
        if (entry.second.nextRun <= now) {
            entry.second.nextRun = now + entry.second.interval;
            due.emplace_back(entry.first, entry.second);
        }
    }
    lock.unlock();

    for (const auto& entry : due) {
        executeTask(entry.first, entry.second);
    }
}

void Scheduler::executeTask(const std::string& taskId, const Task& task) {
    try {
        task.callback();
    } catch (const std::exception& e) {
        Logger::error("Scheduled task " + taskId + " failed: " + e.what());
    }
}

void Scheduler::schedulerLoop() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    while (running_) {
        if (tasks_.empty()) {
            condition_.wait(lock, [this] {
                return !running_ || !tasks_.empty();
            });
            continue;
        }

        auto nextTask = std::min_element(tasks_.begin(), tasks_.end(),
            [](const auto& a, const auto& b) {
                return a.second.nextRun < b.second.nextRun;
            });

        auto now = Clock::now();
        if (nextTask->second.nextRun <= now) {
            std::string taskId = nextTask->first;
            nextTask->second.nextRun = now + nextTask->second.interval;
            Task task = nextTask->second;

            lock.unlock();
            executeTask(taskId, task);
            lock.lock();
        } else {
            Clock::time_point wakeAt = nextTask->second.nextRun;
            uint64_t generation = generation_;
            condition_.wait_until(lock, wakeAt, [this, generation] {
                return !running_ || generation_ != generation;
            });
        }
    }
}
