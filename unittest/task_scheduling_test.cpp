#include <gtest/gtest.h>
#include "common/parallel_task_manager.hpp"
#include "common/scheduler.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

// Spins until `counter` reaches `target` or the timeout expires
bool waitForCount(const std::atomic<int>& counter, int target, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (counter.load() < target) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace

class ParallelTaskManagerTest : public ::testing::Test {
protected:
    ParallelTaskManager taskManager_;
};

TEST_F(ParallelTaskManagerTest, TasksRunInParallel) {
    std::atomic<int> arrived{0};
    std::atomic<int> sawPeers{0};

    for (int i = 0; i < 4; ++i) {
        taskManager_.addTask("task-" + std::to_string(i), [&]() {
            arrived++;
            if (waitForCount(arrived, 4, std::chrono::seconds(5))) {
                sawPeers++;
            }
        });
    }
    taskManager_.waitForAll();

    EXPECT_EQ(sawPeers.load(), 4);
    TaskStats stats = taskManager_.getStats();
    EXPECT_EQ(stats.totalTasks, 4u);
    EXPECT_EQ(stats.completedTasks, 4u);
    EXPECT_EQ(stats.activeTasks, 0u);
}

TEST_F(ParallelTaskManagerTest, ThrowingTaskCountsAsFailed) {
    taskManager_.addTask("bad", []() { throw std::runtime_error("boom"); });
    taskManager_.addTask("good", []() {});
    taskManager_.waitForAll();

    TaskStats stats = taskManager_.getStats();
    EXPECT_EQ(stats.failedTasks, 1u);
    EXPECT_EQ(stats.completedTasks, 1u);
    EXPECT_EQ(taskManager_.getActiveTaskCount(), 0u);
}

TEST_F(ParallelTaskManagerTest, AcceptsNewTasksAfterWaiting) {
    std::atomic<int> runs{0};
    taskManager_.addTask("first", [&]() { runs++; });
    taskManager_.waitForAll();
    taskManager_.addTask("second", [&]() { runs++; });
    taskManager_.waitForAll();
    EXPECT_EQ(runs.load(), 2);
}

TEST(SchedulerTest, CancelledTaskNeverFires) {
    Scheduler scheduler;
    std::atomic<int> runs{0};

    ASSERT_TRUE(scheduler.schedulePeriodicTask("tick", 1, [&]() { runs++; }));
    ASSERT_TRUE(scheduler.schedulePeriodicTask("dropped", 1, [&]() { runs += 100; }));
    EXPECT_TRUE(scheduler.cancelTask("dropped"));
    scheduler.start();

    EXPECT_TRUE(waitForCount(runs, 1, std::chrono::seconds(5)));
    scheduler.stop();
    EXPECT_LT(runs.load(), 100);
    EXPECT_FALSE(scheduler.hasTask("dropped"));
}

TEST(SchedulerTest, PeriodicTaskFiresOnSchedulerThread) {
    Scheduler scheduler;
    std::atomic<int> runs{0};

    ASSERT_TRUE(scheduler.schedulePeriodicTask("tick", 1, [&]() { runs++; }));
    scheduler.start();
    EXPECT_TRUE(scheduler.isRunning());

    EXPECT_TRUE(waitForCount(runs, 1, std::chrono::seconds(5)));
    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_TRUE(scheduler.hasTask("tick"));
}

TEST(SchedulerTest, TaskExceptionDoesNotStopScheduler) {
    Scheduler scheduler;
    std::atomic<int> runs{0};

    ASSERT_TRUE(scheduler.schedulePeriodicTask("bad", 1, []() { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(scheduler.schedulePeriodicTask("good", 1, [&]() { runs++; }));
    scheduler.start();

    EXPECT_TRUE(waitForCount(runs, 2, std::chrono::seconds(6)));
    EXPECT_TRUE(scheduler.isRunning());
    EXPECT_TRUE(scheduler.hasTask("bad"));
    scheduler.stop();
}

TEST(SchedulerTest, RejectsInvalidTasks) {
    Scheduler scheduler;
    EXPECT_FALSE(scheduler.schedulePeriodicTask("zero", 0, []() {}));
    EXPECT_FALSE(scheduler.schedulePeriodicTask("empty", 60, Scheduler::TaskCallback()));
    EXPECT_TRUE(scheduler.schedulePeriodicTask("ok", 60, []() {}));
    EXPECT_TRUE(scheduler.cancelTask("ok"));
    EXPECT_FALSE(scheduler.cancelTask("ok"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
