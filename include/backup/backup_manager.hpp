#pragma once

#include "backup/backup_config.hpp"
#include "backup/rclone_runner.hpp"
#include "common/config_manager.hpp"
#include "common/history_store.hpp"
#include "common/first_run_marker.hpp"
#include "common/run_state_store.hpp"
#include "common/parallel_task_manager.hpp"
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <mutex>

using CompletionCallback = std::function<void(const std::string& name, bool success)>;

// Launches one rclone run per configured backup set, tracks their live state
// and records outcomes. Owns the configuration snapshot the runs are built from.
class BackupManager {
public:
    BackupManager(std::shared_ptr<ConfigProvider> configProvider,
                  std::shared_ptr<HistoryStore> history,
                  const std::string& firstRunFlagPath,
                  std::shared_ptr<RcloneRunner> runner = std::make_shared<RcloneRunner>());
    virtual ~BackupManager();

    BackupManager(const BackupManager&) = delete;
    BackupManager& operator=(const BackupManager&) = delete;

    // Configuration
    void reloadConfig();
    std::vector<BackupSetConfig> getBackupSets() const;
    TransferSettings getSettings() const;
    AppSettings getAppSettings() const;

    // Called once per finished backup set
    void onBackupComplete(CompletionCallback callback);

    // Returns false without side effects while a previous batch or any of its workers is still running
    bool startAll(bool dryRun = false);
    bool isRunning() const;
    size_t getRunningCount() const;
    void waitForAll();

    // Status and history
    RunStatusMap getStatus() const;
    std::string getLogs(const std::string& name) const;
    std::vector<std::string> getSkippedSets() const;
    std::string getLastRunTime(const std::string& name) const;
    RunStatistics getStatistics() const;
    std::vector<RunHistoryEntry> getRecentHistory(size_t limit = 10) const;

    std::shared_ptr<RcloneRunner> getRunner() const { return runner_; }
    std::string getLastError() const;

    static std::vector<std::string> buildExtraArgs(const TransferSettings& settings,
                                                   bool firstRun, bool dryRun);
    static std::string adjustRemotePath(const std::string& local, const std::string& remote);

protected:
    // Hands a run to its worker thread; throws when the worker cannot be started
    virtual void launchTask(const std::string& name, ParallelTaskManager::Task task);

private:
    void refreshSnapshot();
    void runBackup(const BackupSetConfig& backupSet, const std::vector<std::string>& extraArgs);
    void notifyComplete(const std::string& name, bool success);

    std::shared_ptr<ConfigProvider> configProvider_;
    std::shared_ptr<HistoryStore> history_;
    std::shared_ptr<RcloneRunner> runner_;
    FirstRunMarker firstRunMarker_;
    RunStateStore state_;

    BackupManagerConfig config_;
    mutable std::mutex configMutex_;

    std::vector<CompletionCallback> callbacks_;
    mutable std::mutex callbacksMutex_;

    std::vector<std::string> skippedSets_;
    std::string lastError_;
    mutable std::mutex launchMutex_;

    // Last member: its destructor joins the workers before anything they use goes away
    ParallelTaskManager taskManager_;
};
