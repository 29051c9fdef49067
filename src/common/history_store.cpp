#include "common/history_store.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <algorithm>

using json = nlohmann::json;

namespace {

json entryToJson(const RunHistoryEntry& entry, bool withName) {
    json j = {
        {"timestamp", entry.timestamp},
        {"success", entry.success},
        {"duration", entry.durationSeconds}
    };
    if (withName) {
        j["name"] = entry.name;
    }
    return j;
}

RunHistoryEntry entryFromJson(const json& j, const std::string& name) {
    RunHistoryEntry entry;
    entry.name = j.value("name", name);
    entry.timestamp = j.value("timestamp", std::string());
    entry.success = j.value("success", false);
    entry.durationSeconds = j.value("duration", 0.0);
    return entry;
}

} // namespace

HistoryStore::HistoryStore(const std::string& statePath)
    : statePath_(statePath) {
    load();
}

void HistoryStore::resetToDefaults() {
    lastRuns_.clear();
    history_.clear();
    statistics_ = RunStatistics{};
}

void HistoryStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    resetToDefaults();

    if (!std::filesystem::exists(statePath_)) {
        Logger::debug("No history file at " + statePath_ + ", starting empty");
        return;
    }

    try {
        std::ifstream file(statePath_);
        if (!file.is_open()) {
            Logger::error("Failed to open history file for reading: " + statePath_);
            return;
        }
        json state;
        file >> state;
        fromJson(state);
    } catch (const std::exception& e) {
        Logger::error("Failed to load state: " + std::string(e.what()));
        resetToDefaults();
    }
}

void HistoryStore::fromJson(const json& state) {
    if (!state.is_object()) {
        throw std::runtime_error("history root is not an object");
    }

    if (state.contains("last_runs")) {
        for (const auto& item : state.at("last_runs").items()) {
            lastRuns_[item.key()] = entryFromJson(item.value(), item.key());
        }
    }

    if (state.contains("run_history")) {
        for (const auto& item : state.at("run_history")) {
            history_.push_back(entryFromJson(item, std::string()));
        }
        if (history_.size() > kMaxHistoryEntries) {
            history_.erase(history_.begin(), history_.end() - kMaxHistoryEntries);
        }
    }

    if (state.contains("statistics")) {
        const auto& stats = state.at("statistics");
        statistics_.totalRuns = stats.value("total_runs", 0LL);
        statistics_.successfulRuns = stats.value("successful_runs", 0LL);
        statistics_.failedRuns = stats.value("failed_runs", 0LL);
    }
}

json HistoryStore::toJson() const {
    json lastRuns = json::object();
    for (const auto& pair : lastRuns_) {
        lastRuns[pair.first] = entryToJson(pair.second, false);
    }

    json history = json::array();
    for (const auto& entry : history_) {
        history.push_back(entryToJson(entry, true));
    }

    return {
        {"last_runs", lastRuns},
        {"run_history", history},
        {"statistics", {
            {"total_runs", statistics_.totalRuns},
            {"successful_runs", statistics_.successfulRuns},
            {"failed_runs", statistics_.failedRuns}
        }}
    };
}

bool HistoryStore::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked();
}

bool HistoryStore::saveLocked() const {
    try {
        std::filesystem::path dir = std::filesystem::path(statePath_).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir);
        }

        std::ofstream file(statePath_, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("Failed to open history file for writing: " + statePath_);
            return false;
        }
        file << toJson().dump(2);
        if (!file) {
            Logger::error("Failed to write history file: " + statePath_);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        Logger::error("Failed to save state: " + std::string(e.what()));
        return false;
    }
}

void HistoryStore::recordRun(const std::string& name, bool success, double durationSeconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    RunHistoryEntry entry;
    entry.name = name;
    entry.timestamp = currentTimestamp();
    entry.success = success;
    entry.durationSeconds = durationSeconds;

    lastRuns_[name] = entry;

    history_.push_back(entry);
    if (history_.size() > kMaxHistoryEntries) {
        history_.erase(history_.begin(), history_.end() - kMaxHistoryEntries);
    }

    statistics_.totalRuns++;
    if (success) {
        statistics_.successfulRuns++;
    } else {
        statistics_.failedRuns++;
    }

    // In-memory state stays authoritative if the write fails
    saveLocked();
}

std::optional<RunHistoryEntry> HistoryStore::getLastRun(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastRuns_.find(name);
    if (it == lastRuns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string HistoryStore::getLastRunTime(const std::string& name) const {
    auto lastRun = getLastRun(name);
    if (!lastRun) {
        return "Never";
    }
    return formatTimestamp(lastRun->timestamp);
}

RunStatistics HistoryStore::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statistics_;
}

std::vector<RunHistoryEntry> HistoryStore::getRecentHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = std::min(limit, history_.size());
    return std::vector<RunHistoryEntry>(history_.rbegin(), history_.rbegin() + count);
}

size_t HistoryStore::getHistorySize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

std::string HistoryStore::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm localTm{};
    localtime_r(&time, &localTm);

    std::ostringstream ss;
    ss << std::put_time(&localTm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

std::string HistoryStore::formatTimestamp(const std::string& isoTimestamp) {
    std::tm parsed{};
    std::istringstream in(isoTimestamp);
    in >> std::get_time(&parsed, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return "Unknown";
    }

    std::ostringstream out;
    out << std::put_time(&parsed, "%Y-%m-%d %H:%M:%S");
    return out.str();
}
