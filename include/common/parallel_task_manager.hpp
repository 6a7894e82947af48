#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

struct TaskStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t failedTasks{0};
    double averageTaskTime{0.0};
    size_t currentQueueSize{0};
};

enum class TaskPriority {
    LOW,
    NORMAL,
    HIGH
};

class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency(),
                                 const std::string& name = "tasks");
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    template<typename F, typename... Args>
    auto addTask(F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    template<typename F, typename... Args>
    auto addPriorityTask(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    // Blocks until the queue is drained and no task is executing
    void waitForAll();

    // Stops accepting work; queued tasks still run before workers exit
    void shutdown();

    size_t getActiveThreadCount() const;
    TaskStats getStats() const;

private:
    struct Task {
        std::function<bool()> func;  // false when the task threw
        TaskPriority priority;
        uint64_t sequence;
        std::chrono::steady_clock::time_point queuedAt;
    };

    struct TaskOrder {
        bool operator()(const Task& a, const Task& b) const {
            if (a.priority != b.priority) {
                return a.priority < b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    template<typename R>
    void enqueue(std::shared_ptr<std::packaged_task<R()>> task, TaskPriority priority);

    void workerThread();
    void updateStats(std::chrono::steady_clock::time_point startedAt, bool success);

    std::string name_;
    std::vector<std::thread> workers_;
    std::priority_queue<Task, std::vector<Task>, TaskOrder> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idleCondition_;
    bool stop_;
    uint64_t nextSequence_{0};

    mutable std::mutex statsMutex_;
    TaskStats stats_;
    size_t activeTasks_{0};
};

template<typename R>
void ParallelTaskManager::enqueue(std::shared_ptr<std::packaged_task<R()>> task, TaskPriority priority) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager " + name_);
        }

        Task t{
            [task]() {
                (*task)();
                return true;
            },
            priority,
            nextSequence_++,
            std::chrono::steady_clock::now()
        };
        tasks_.push(std::move(t));
    }
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.totalTasks++;
        stats_.currentQueueSize++;
    }
    condition_.notify_one();
}

template<typename F, typename... Args>
auto ParallelTaskManager::addTask(F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {
    return addPriorityTask(TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ParallelTaskManager::addPriorityTask(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {
    using return_type = typename std::result_of<F(Args...)>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    enqueue(task, priority);
    return result;
}
