#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <map>

// Exit codes produced locally, never by rclone itself
constexpr int kExitToolNotFound = 127;
constexpr int kExitLocalError = 1;

enum class RunState {
    Pending,    // queued, runner not started yet
    Running,
    Completed
};

struct RunStatus {
    RunState state{RunState::Pending};
    double percent{0.0};
    std::string line;
    std::optional<int> exitCode;  // absent while the process is alive
    double durationSeconds{0.0};
    std::chrono::system_clock::time_point startTime;  // set when the runner starts

    bool isRunning() const { return !exitCode.has_value(); }
    bool succeeded() const { return exitCode.has_value() && *exitCode == 0; }
};

using RunStatusMap = std::map<std::string, RunStatus>;

struct RunHistoryEntry {
    std::string name;
    std::string timestamp;  // ISO-8601, local time
    bool success{false};
    double durationSeconds{0.0};
};

struct RunStatistics {
    long long totalRuns{0};
    long long successfulRuns{0};
    long long failedRuns{0};
};
