#include <gtest/gtest.h>
#include "common/parallel_task_manager.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

class ParallelTaskManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<ParallelTaskManager>(4);
    }

    std::unique_ptr<ParallelTaskManager> manager_;
};

TEST_F(ParallelTaskManagerTest, RunsTasksAndReturnsResults) {
    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(manager_->addTask([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
    EXPECT_EQ(manager_->getThreadCount(), 4u);
}

TEST_F(ParallelTaskManagerTest, ExceptionsSurfaceThroughFuture) {
    auto result = manager_->addTask([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(result.get(), std::runtime_error);
}

TEST_F(ParallelTaskManagerTest, WaitForAllDrainsQueue) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 50; ++i) {
        manager_->addTask([&counter]() { counter++; });
    }
    manager_->waitForAll();
    EXPECT_EQ(counter.load(), 50);

    TaskStats stats = manager_->getStats();
    EXPECT_EQ(stats.totalTasks, 50u);
    EXPECT_EQ(stats.completedTasks, 50u);
    EXPECT_EQ(stats.currentQueueSize, 0u);
}

TEST(ParallelTaskManagerCancelTest, QueuedTasksSeeCancelledHandle) {
    ParallelTaskManager manager(1);
    TaskHandle handle;
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<int> ran{0};

    auto blocker = manager.addTask([opened]() { opened.wait(); });
    std::vector<std::future<bool>> queued;
    for (int i = 0; i < 3; ++i) {
        queued.push_back(manager.addTask([&handle, &ran]() {
            if (handle.isCancelled()) {
                return false;
            }
            ++ran;
            return true;
        }));
    }

    // The single worker is parked on the gate until the handle is cancelled
    handle.cancel();
    gate.set_value();

    blocker.get();
    for (auto& f : queued) {
        EXPECT_FALSE(f.get());
    }
    EXPECT_EQ(ran.load(), 0);
    manager.waitForAll();
    EXPECT_EQ(manager.getStats().completedTasks, 4u);
}

TEST(TaskHandleTest, CancelIsSticky) {
    TaskHandle handle;
    EXPECT_FALSE(handle.isCancelled());
    handle.cancel();
    EXPECT_TRUE(handle.isCancelled());
}
