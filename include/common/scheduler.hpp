#pragma once

#include <string>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <map>
#include <atomic>
#include <thread>
#include <ctime>

class Scheduler {
public:
    using TaskCallback = std::function<void()>;
    using TimePoint = time_t;
    using Duration = int;  // seconds

    Scheduler();
    ~Scheduler();

    // Schedule a task to run every `interval` seconds, first run after one interval
    bool schedulePeriodicTask(const std::string& taskId,
                              Duration interval,
                              TaskCallback callback);

    bool cancelTask(const std::string& taskId);
    bool hasTask(const std::string& taskId) const;

    void start();
    void stop();
    bool isRunning() const { return running_; }

private:
    struct Task {
        TimePoint scheduledTime;
        Duration interval;
        TaskCallback callback;
    };

    void executeTask(const std::string& taskId, const Task& task);
    void schedulerLoop();

    std::map<std::string, Task> tasks_;
    mutable std::mutex tasksMutex_;
    std::condition_variable condition_;
    std::atomic<bool> running_;
    std::thread schedulerThread_;
};
