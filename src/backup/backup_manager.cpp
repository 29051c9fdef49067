#include "backup/backup_manager.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace {

const std::string kRule(60, '=');

// Forwards runner events for one backup set into the run-state store
class RunStateObserver : public RunObserver {
public:
    RunStateObserver(RunStateStore& state, const std::string& name)
        : state_(state), name_(name) {}

    void onProgress(double percent, const std::string& statusLine) override {
        state_.updateProgress(name_, percent, statusLine);
    }

    void onLogLine(const std::string& line) override {
        state_.appendLog(name_, line);
    }

private:
    RunStateStore& state_;
    std::string name_;
};

std::string formatLocalTime(std::chrono::system_clock::time_point timePoint) {
    auto time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm localTm{};
    localtime_r(&time, &localTm);
    std::ostringstream ss;
    ss << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string formatDuration(double seconds) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << seconds;
    return ss.str();
}

} // namespace

BackupManager::BackupManager(std::shared_ptr<ConfigProvider> configProvider,
                             std::shared_ptr<HistoryStore> history,
                             const std::string& firstRunFlagPath,
                             std::shared_ptr<RcloneRunner> runner)
    : configProvider_(configProvider)
    , history_(history)
    , runner_(runner)
    , firstRunMarker_(firstRunFlagPath) {
    if (!configProvider_ || !history_ || !runner_) {
        throw std::invalid_argument("BackupManager requires a config provider, history store and runner");
    }
    refreshSnapshot();
}

BackupManager::~BackupManager() {
    // In-flight rclone processes are not killed, only waited for
    taskManager_.waitForAll();
}

void BackupManager::refreshSnapshot() {
    BackupManagerConfig snapshot;
    snapshot.backupSets = configProvider_->getBackupSets();
    snapshot.settings = configProvider_->getSettings();
    snapshot.appSettings = configProvider_->getAppSettings();

    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = snapshot;
}

void BackupManager::reloadConfig() {
    if (!configProvider_->reload()) {
        Logger::warning("Configuration reload reported errors, using defaults where needed");
    }
    refreshSnapshot();
    Logger::info("Configuration reloaded");
}

std::vector<BackupSetConfig> BackupManager::getBackupSets() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.backupSets;
}

TransferSettings BackupManager::getSettings() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.settings;
}

AppSettings BackupManager::getAppSettings() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.appSettings;
}

void BackupManager::onBackupComplete(CompletionCallback callback) {
    if (!callback) {
        return;
    }
    std::lock_guard<std::mutex> lock(callbacksMutex_);
    callbacks_.push_back(std::move(callback));
}

std::vector<std::string> BackupManager::buildExtraArgs(const TransferSettings& settings,
                                                       bool firstRun, bool dryRun) {
    std::vector<std::string> extras = {
        "--transfers=" + std::to_string(settings.transfers),
        "--checkers=" + std::to_string(settings.checkers),
        "--retries=" + std::to_string(settings.retries),
        "--retries-sleep=" + settings.retriesSleep,
        "--stats-one-line"
    };
    if (firstRun) {
        extras.push_back("--checksum");
    }
    if (dryRun) {
        extras.push_back("--dry-run");
    }
    return extras;
}

std::string BackupManager::adjustRemotePath(const std::string& local, const std::string& remote) {
    auto colon = remote.find(':');
    if (colon == std::string::npos) {
        return remote;
    }

    const std::string path = remote.substr(colon + 1);
    if (path.find('/') != std::string::npos) {
        return remote;
    }

    std::string source = local;
    while (source.size() > 1 && source.back() == '/') {
        source.pop_back();
    }
    const std::string folderName = std::filesystem::path(source).filename().string();
    if (folderName.empty()) {
        return remote;
    }

    // "remote:" gets the folder at its root, "remote:bucket" gets a subfolder
    return path.empty() ? remote + folderName : remote + "/" + folderName;
}

bool BackupManager::startAll(bool dryRun) {
    std::vector<std::pair<std::string, std::string>> failedLaunches;
    {
        std::lock_guard<std::mutex> launchLock(launchMutex_);

        if (isRunning()) {
            lastError_ = "A backup batch is already running";
            Logger::warning(lastError_ + ", ignoring start request");
            return false;
        }

        BackupManagerConfig config;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            config = config_;
        }

        const bool firstRun = !firstRunMarker_.exists();
        if (firstRun) {
            Logger::info("First run detected, using --checksum for accuracy");
        }
        if (dryRun) {
            Logger::info("Dry run mode enabled");
        }

        const std::vector<std::string> extras = buildExtraArgs(config.settings, firstRun, dryRun);

        skippedSets_.clear();
        for (const auto& backupSet : config.backupSets) {
            if (backupSet.local.empty() || backupSet.remote.empty()) {
                Logger::warning("Skipping " + backupSet.name + ": missing local or remote path");
                skippedSets_.push_back(backupSet.name);
                continue;
            }

            state_.resetForRun(backupSet.name);
            try {
                launchTask(backupSet.name, [this, backupSet, extras]() {
                    runBackup(backupSet, extras);
                });
            } catch (const std::exception& e) {
                Logger::error("Failed to launch " + backupSet.name + ": " + e.what());
                failedLaunches.emplace_back(backupSet.name, e.what());
            }
        }

        // The marker only affects the next batch
        if (firstRun && !config.backupSets.empty()) {
            if (!firstRunMarker_.mark()) {
                Logger::warning("First run marker not written: " + firstRunMarker_.getLastError());
            }
        }

        lastError_.clear();
    }

    // Outside the launch lock: completion callbacks may call back into the manager
    for (const auto& failed : failedLaunches) {
        state_.appendLog(failed.first, "ERROR: " + failed.second + "\n");
        state_.finish(failed.first, kExitLocalError, 0.0, {});
        history_->recordRun(failed.first, false, 0.0);
        notifyComplete(failed.first, false);
    }
    return true;
}

void BackupManager::launchTask(const std::string& name, ParallelTaskManager::Task task) {
    taskManager_.addTask(name, std::move(task));
}

void BackupManager::runBackup(const BackupSetConfig& backupSet, const std::vector<std::string>& extraArgs) {
    const std::string& name = backupSet.name;
    const auto startWall = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    const std::string remote = adjustRemotePath(backupSet.local, backupSet.remote);

    state_.markStarted(name);
    state_.appendLog(name, kRule + "\n");
    state_.appendLog(name, "Backup: " + name + "\n");
    state_.appendLog(name, "Source: " + backupSet.local + "\n");
    state_.appendLog(name, "Target: " + remote + "\n");
    state_.appendLog(name, "Started: " + formatLocalTime(startWall) + "\n");
    state_.appendLog(name, kRule + "\n\n");

    Logger::info("Starting: " + name + " (" + backupSet.local + " -> " + remote + ")");

    RunStateObserver observer(state_, name);
    const int rc = runner_->runCopy(backupSet.local, remote, extraArgs, &observer);

    const double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    const bool success = (rc == 0);

    state_.finish(name, rc, duration, {
        "\n" + kRule + "\n",
        "Completed: " + formatLocalTime(std::chrono::system_clock::now()) + "\n",
        "Duration: " + formatDuration(duration) + "s\n",
        std::string("Status: ") + (success ? "SUCCESS" : "FAILED") + "\n",
        kRule + "\n"
    });

    history_->recordRun(name, success, duration);

    Logger::info("Completed: " + name + " (exit code: " + std::to_string(rc) +
                 ", duration: " + formatDuration(duration) + "s)");

    notifyComplete(name, success);
}

void BackupManager::notifyComplete(const std::string& name, bool success) {
    std::vector<CompletionCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacksMutex_);
        callbacks = callbacks_;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(name, success);
        } catch (const std::exception& e) {
            Logger::error("Callback error for " + name + ": " + e.what());
        }
    }
}

bool BackupManager::isRunning() const {
    // Workers sharing a set name can outlive that name's terminal status
    return state_.isAnyRunning() || taskManager_.getActiveTaskCount() > 0;
}

size_t BackupManager::getRunningCount() const {
    return state_.getRunningCount();
}

void BackupManager::waitForAll() {
    taskManager_.waitForAll();
}

RunStatusMap BackupManager::getStatus() const {
    return state_.snapshotStatus();
}

std::string BackupManager::getLogs(const std::string& name) const {
    return state_.getLog(name);
}

std::vector<std::string> BackupManager::getSkippedSets() const {
    std::lock_guard<std::mutex> lock(launchMutex_);
    return skippedSets_;
}

std::string BackupManager::getLastRunTime(const std::string& name) const {
    return history_->getLastRunTime(name);
}

RunStatistics BackupManager::getStatistics() const {
    return history_->getStatistics();
}

std::vector<RunHistoryEntry> BackupManager::getRecentHistory(size_t limit) const {
    return history_->getRecentHistory(limit);
}

std::string BackupManager::getLastError() const {
    std::lock_guard<std::mutex> lock(launchMutex_);
    return lastError_;
}
