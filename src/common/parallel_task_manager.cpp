#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"

ParallelTaskManager::ParallelTaskManager(size_t numThreads, const std::string& name)
    : name_(name)
    , stop_(false) {
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
    }
    if (numThreads == 0) {
        numThreads = 2;
    }

    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ParallelTaskManager::workerThread, this);
    }
    Logger::debug("Task manager " + name_ + " started with " + std::to_string(numThreads) + " threads");
}

ParallelTaskManager::~ParallelTaskManager() {
    shutdown();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ParallelTaskManager::waitForAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

void ParallelTaskManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

void ParallelTaskManager::workerThread() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !tasks_.empty() || stop_;
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = tasks_.top();
            tasks_.pop();
            ++activeTasks_;
        }

        auto startedAt = std::chrono::steady_clock::now();
        bool success = false;
        try {
            // packaged_task stores exceptions in its future; anything escaping here is a bug
            success = task.func ? task.func() : true;
        } catch (const std::exception& e) {
            Logger::error("Task manager " + name_ + ": task raised outside its future: " + e.what());
        }
        updateStats(startedAt, success);

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
            if (tasks_.empty() && activeTasks_ == 0) {
                idleCondition_.notify_all();
            }
        }
    }
}

void ParallelTaskManager::updateStats(std::chrono::steady_clock::time_point startedAt, bool success) {
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt).count();

    std::lock_guard<std::mutex> lock(statsMutex_);
    if (stats_.currentQueueSize > 0) {
        stats_.currentQueueSize--;
    }
    if (success) {
        stats_.completedTasks++;
    } else {
        stats_.failedTasks++;
    }
    size_t finished = stats_.completedTasks + stats_.failedTasks;
    stats_.averageTaskTime += (elapsed - stats_.averageTaskTime) / static_cast<double>(finished);
}

size_t ParallelTaskManager::getActiveThreadCount() const {
    return workers_.size();
}

TaskStats ParallelTaskManager::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}
