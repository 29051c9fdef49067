#pragma once

#include "common/run_status.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>

// Durable run history: last run per set, a capped FIFO of recent runs and
// monotonic counters. Persisted as JSON after every recorded run.
class HistoryStore {
public:
    static constexpr size_t kMaxHistoryEntries = 100;

    explicit HistoryStore(const std::string& statePath);

    // Reloads from disk. Missing or corrupt file yields empty defaults.
    void load();
    bool save() const;

    void recordRun(const std::string& name, bool success, double durationSeconds);

    std::optional<RunHistoryEntry> getLastRun(const std::string& name) const;
    std::string getLastRunTime(const std::string& name) const;
    RunStatistics getStatistics() const;
    std::vector<RunHistoryEntry> getRecentHistory(size_t limit = 10) const;
    size_t getHistorySize() const;

    const std::string& getStatePath() const { return statePath_; }

    static std::string currentTimestamp();
    static std::string formatTimestamp(const std::string& isoTimestamp);

private:
    void resetToDefaults();
    bool saveLocked() const;
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& state);

    std::string statePath_;
    std::map<std::string, RunHistoryEntry> lastRuns_;
    std::vector<RunHistoryEntry> history_;
    RunStatistics statistics_;
    mutable std::mutex mutex_;
};
