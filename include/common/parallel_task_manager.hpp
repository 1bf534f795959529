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
#include <stdexcept>
#include <type_traits>

// Shared stop flag handed to long-running tasks so they can stop claiming work
class TaskHandle {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

struct TaskStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t currentQueueSize{0};
};

class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    // Queue a task; exceptions it throws surface through the returned future
    template<typename F>
    auto addTask(F&& f) -> std::future<typename std::result_of<F()>::type>;

    // Wait for all tasks to complete
    void waitForAll();

    size_t getThreadCount() const;
    TaskStats getStats() const;

private:
    void workerThread();
    void stop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idleCondition_;
    bool stop_;
    size_t activeTasks_;

    mutable std::mutex statsMutex_;
    TaskStats stats_;
};

template<typename F>
auto ParallelTaskManager::addTask(F&& f) -> std::future<typename std::result_of<F()>::type> {
    using return_type = typename std::result_of<F()>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }
        tasks_.emplace([task]() { (*task)(); });

        std::lock_guard<std::mutex> statsLock(statsMutex_);
        stats_.totalTasks++;
        stats_.currentQueueSize++;
    }

    condition_.notify_one();
    return result;
}
