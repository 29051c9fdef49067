#include "common/scheduler.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <algorithm>
#include <sstream>

Scheduler::Scheduler()
    : running_(false) {
}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::schedulePeriodicTask(const std::string& taskId,
                                     Duration interval,
                                     TaskCallback callback) {
    if (interval <= 0 || !callback) {
        Logger::error("Invalid periodic task " + taskId + " (interval " + std::to_string(interval) + "s)");
        return false;
    }
    std::lock_guard<std::mutex> lock(tasksMutex_);
    auto now = std::time(nullptr);
    tasks_[taskId] = {now + interval, interval, std::move(callback)};
    condition_.notify_one();
    return true;
}

bool Scheduler::cancelTask(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    bool removed = tasks_.erase(taskId) > 0;
    condition_.notify_one();
    return removed;
}

bool Scheduler::hasTask(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    return tasks_.count(taskId) > 0;
}

void Scheduler::start() {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    if (!running_) {
        running_ = true;
        schedulerThread_ = std::thread(&Scheduler::schedulerLoop, this);
    }
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        condition_.notify_all();
    }
    if (schedulerThread_.joinable() && schedulerThread_.get_id() != std::this_thread::get_id()) {
        schedulerThread_.join();
    }
}

void Scheduler::executeTask(const std::string& taskId, const Task& task) {
    try {
        task.callback();
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Task " << taskId << " failed: " << e.what();
        Logger::error(ss.str());
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

        auto now = std::time(nullptr);
        auto nextTask = std::min_element(tasks_.begin(), tasks_.end(),
            [](const auto& a, const auto& b) {
                return a.second.scheduledTime < b.second.scheduledTime;
            });

        if (nextTask->second.scheduledTime <= now) {
            auto taskId = nextTask->first;
            auto task = nextTask->second;

            nextTask->second.scheduledTime = now + task.interval;

            lock.unlock();
            executeTask(taskId, task);
            lock.lock();
        } else {
            // Re-evaluated on any schedule change or stop
            condition_.wait_for(lock,
                std::chrono::seconds(nextTask->second.scheduledTime - now));
        }
    }
}
