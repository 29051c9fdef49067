#pragma once

#include "backup/backup_manager.hpp"
#include "common/config_manager.hpp"
#include <memory>
#include <string>
#include <vector>

class BackupCLI {
public:
    BackupCLI(std::shared_ptr<BackupManager> manager,
              std::shared_ptr<ConfigManager> configManager);
    ~BackupCLI();

    // argv[0] is the command name; returns the process exit code
    int run(int argc, char* argv[]);

    static void printUsage();

private:
    int handleRunCommand(int argc, char* argv[]);
    int handleStatusCommand(int argc, char* argv[]);
    int handleHistoryCommand(int argc, char* argv[]);
    int handleCheckCommand(int argc, char* argv[]);
    int handleRemotesCommand(int argc, char* argv[]);
    int handleAddCommand(int argc, char* argv[]);
    int handleRemoveCommand(int argc, char* argv[]);
    int handleDaemonCommand(int argc, char* argv[]);

    void printProgress() const;
    void printLogs(const std::vector<std::string>& names) const;

    std::shared_ptr<BackupManager> manager_;
    std::shared_ptr<ConfigManager> configManager_;
};
