#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

// Runs periodic maintenance callbacks on a single background thread.
class Scheduler {
public:
    using TaskCallback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    Scheduler();
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Replaces any task registered under the same id
    bool schedulePeriodicTask(const std::string& taskId,
                              std::chrono::seconds interval,
                              TaskCallback callback);
    bool cancelTask(const std::string& taskId);

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Runs every task that is due now; used when no background thread is wanted
    void processTasks();

private:
    struct Task {
        Clock::time_point nextRun;
        std::chrono::seconds interval;
        TaskCallback callback;
    };

    void schedulerLoop();
    void executeTask(const std::string& taskId, const Task& task);

    std::map<std::string, Task> tasks_;
    std::mutex tasksMutex_;
    std::condition_variable condition_;
    uint64_t generation_{0};
    std::atomic<bool> running_;
    std::thread schedulerThread_;
};
