#pragma once

#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <string>

struct TaskStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t failedTasks{0};
    size_t activeTasks{0};
};

// Runs every task on its own thread so that long blocking tasks never wait
// for a free worker. Threads are joined by waitForAll() or the destructor.
class ParallelTaskManager {
public:
    using Task = std::function<void()>;

    ParallelTaskManager() = default;
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    void addTask(const std::string& name, Task task);

    // Must not be called from inside a task
    void waitForAll();

    size_t getActiveTaskCount() const;
    TaskStats getStats() const;

private:
    void runTask(const std::string& name, const Task& task);

    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    TaskStats stats_;
};
