#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"
#include <stdexcept>
#include <system_error>

ParallelTaskManager::~ParallelTaskManager() {
    waitForAll();
}

void ParallelTaskManager::addTask(const std::string& name, Task task) {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Every previous task has returned, their threads can be reclaimed
        if (stats_.activeTasks == 0) {
            finished.swap(workers_);
        }
        stats_.totalTasks++;
        stats_.activeTasks++;
    }

    for (auto& thread : finished) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    try {
        std::thread worker(&ParallelTaskManager::runTask, this, name, std::move(task));
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.push_back(std::move(worker));
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.activeTasks--;
        stats_.failedTasks++;
        condition_.notify_all();
        throw std::runtime_error("Failed to start task " + name + ": " + e.what());
    }
}

void ParallelTaskManager::runTask(const std::string& name, const Task& task) {
    bool success = true;
    try {
        if (task) {
            task();
        }
    } catch (const std::exception& e) {
        success = false;
        Logger::error("Task " + name + " failed: " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (success) {
        stats_.completedTasks++;
    } else {
        stats_.failedTasks++;
    }
    stats_.activeTasks--;
    if (stats_.activeTasks == 0) {
        condition_.notify_all();
    }
}

void ParallelTaskManager::waitForAll() {
    std::vector<std::thread> workers;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] {
            return stats_.activeTasks == 0;
        });
        workers.swap(workers_);
    }

    for (auto& thread : workers) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

size_t ParallelTaskManager::getActiveTaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_.activeTasks;
}

TaskStats ParallelTaskManager::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}
