#pragma once

#include "common/run_status.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>

// Per backup-set live status and run log. One lock guards both maps.
class RunStateStore {
public:
    RunStateStore() = default;

    // Must be called before the runner for `name` is started; leaves it Pending
    void resetForRun(const std::string& name);
    void markStarted(const std::string& name);
    void updateProgress(const std::string& name, double percent, const std::string& line);
    void appendLog(const std::string& name, const std::string& line);
    void finish(const std::string& name, int exitCode, double durationSeconds,
                const std::vector<std::string>& summaryLines);

    RunStatusMap snapshotStatus() const;
    std::optional<RunStatus> getStatus(const std::string& name) const;
    std::string getLog(const std::string& name) const;
    bool isAnyRunning() const;
    size_t getRunningCount() const;

private:
    RunStatusMap statuses_;
    std::map<std::string, std::vector<std::string>> logs_;
    mutable std::mutex mutex_;
};
