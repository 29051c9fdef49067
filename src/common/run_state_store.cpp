#include "common/run_state_store.hpp"
#include "common/logger.hpp"
#include <algorithm>

void RunStateStore::resetForRun(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    RunStatus status;
    status.state = RunState::Pending;
    status.percent = 0.0;
    status.line = "Starting...";
    statuses_[name] = status;
    logs_[name].clear();
}

void RunStateStore::markStarted(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(name);
    if (it == statuses_.end() || !it->second.isRunning()) {
        return;
    }
    it->second.state = RunState::Running;
    it->second.startTime = std::chrono::system_clock::now();
}

void RunStateStore::updateProgress(const std::string& name, double percent, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(name);
    if (it == statuses_.end()) {
        Logger::warning("Progress update for unknown backup set: " + name);
        return;
    }
    // A finished run is terminal until the next resetForRun
    if (!it->second.isRunning()) {
        return;
    }
    if (it->second.state == RunState::Pending) {
        it->second.state = RunState::Running;
        it->second.startTime = std::chrono::system_clock::now();
    }
    it->second.percent = std::clamp(percent, 0.0, 100.0);
    it->second.line = line;
}

void RunStateStore::appendLog(const std::string& name, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    logs_[name].push_back(line);
}

void RunStateStore::finish(const std::string& name, int exitCode, double durationSeconds,
                           const std::vector<std::string>& summaryLines) {
    std::lock_guard<std::mutex> lock(mutex_);
    RunStatus& status = statuses_[name];
    status.state = RunState::Completed;
    status.percent = 100.0;
    status.line = exitCode == 0 ? "Completed successfully"
                                : "Failed (exit code: " + std::to_string(exitCode) + ")";
    status.exitCode = exitCode;
    status.durationSeconds = durationSeconds;

    auto& log = logs_[name];
    log.insert(log.end(), summaryLines.begin(), summaryLines.end());
}

RunStatusMap RunStateStore::snapshotStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statuses_;
}

std::optional<RunStatus> RunStateStore::getStatus(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(name);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string RunStateStore::getLog(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = logs_.find(name);
    if (it == logs_.end()) {
        return {};
    }
    std::string result;
    for (const auto& line : it->second) {
        result += line;
    }
    return result;
}

bool RunStateStore::isAnyRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(statuses_.begin(), statuses_.end(),
                       [](const auto& entry) { return entry.second.isRunning(); });
}

size_t RunStateStore::getRunningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(statuses_.begin(), statuses_.end(),
                                             [](const auto& entry) { return entry.second.isRunning(); }));
}
