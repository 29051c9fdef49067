#include "backup/backup_cli.hpp"
#include "common/scheduler.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <thread>
#include <atomic>
#include <csignal>
#include <stdexcept>

namespace {

std::atomic<bool> stopRequested{false};

void handleSignal(int) {
    stopRequested = true;
}

const char* stateToString(const RunStatus& status) {
    switch (status.state) {
        case RunState::Pending:   return "pending";
        case RunState::Running:   return "running";
        case RunState::Completed: return status.succeeded() ? "success" : "failed";
        default:                  return "unknown";
    }
}

} // namespace

BackupCLI::BackupCLI(std::shared_ptr<BackupManager> manager,
                     std::shared_ptr<ConfigManager> configManager)
    : manager_(manager)
    , configManager_(configManager) {
}

BackupCLI::~BackupCLI() {
}

void BackupCLI::printUsage() {
    std::cout << "Usage: rclone-backup-manager [options] <command> [command options]\n"
              << "Commands:\n"
              << "  run [--dry-run]            Run every backup set now\n"
              << "  status                     Show last run per backup set and statistics\n"
              << "  history [--limit N]        Show recent runs, most recent first\n"
              << "  check                      Check that rclone is installed\n"
              << "  remotes                    List configured rclone remotes\n"
              << "  add NAME LOCAL REMOTE      Add or replace a backup set\n"
              << "  remove NAME                Remove a backup set\n"
              << "  daemon                     Run backups on the configured interval\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                 Show this help message\n"
              << "  -v, --version              Show version information\n"
              << "  --data-dir DIR             Directory for config, history and logs\n"
              << "  --config FILE              Configuration file (default DIR/folders.json)\n"
              << "  --rclone PATH              rclone executable (default: rclone on PATH)\n"
              << "  --log-level LEVEL          debug, info, warning or error\n";
}

int BackupCLI::run(int argc, char* argv[]) {
    if (argc < 1) {
        printUsage();
        return 1;
    }

    std::string command = argv[0];
    Logger::debug("Dispatching command: " + command);

    if (command == "run") {
        return handleRunCommand(argc, argv);
    } else if (command == "status") {
        return handleStatusCommand(argc, argv);
    } else if (command == "history") {
        return handleHistoryCommand(argc, argv);
    } else if (command == "check") {
        return handleCheckCommand(argc, argv);
    } else if (command == "remotes") {
        return handleRemotesCommand(argc, argv);
    } else if (command == "add") {
        return handleAddCommand(argc, argv);
    } else if (command == "remove") {
        return handleRemoveCommand(argc, argv);
    } else if (command == "daemon") {
        return handleDaemonCommand(argc, argv);
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}

int BackupCLI::handleRunCommand(int argc, char* argv[]) {
    bool dryRun = manager_->getAppSettings().dryRun;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--dry-run") {
            dryRun = true;
        } else {
            std::cerr << "Error: Unknown option for run: " << arg << std::endl;
            return 1;
        }
    }

    if (manager_->getBackupSets().empty()) {
        std::cout << "No backup sets configured in " << configManager_->getConfigPath() << std::endl;
        return 0;
    }

    if (!manager_->startAll(dryRun)) {
        std::cerr << "Error: " << manager_->getLastError() << std::endl;
        return 1;
    }

    while (manager_->isRunning()) {
        printProgress();
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    manager_->waitForAll();

    for (const auto& name : manager_->getSkippedSets()) {
        std::cout << "Skipped " << name << ": missing local or remote path" << std::endl;
    }

    std::vector<std::string> names;
    bool allSucceeded = true;
    for (const auto& entry : manager_->getStatus()) {
        names.push_back(entry.first);
        if (!entry.second.succeeded()) {
            allSucceeded = false;
        }
    }
    printLogs(names);

    for (const auto& entry : manager_->getStatus()) {
        std::cout << std::left << std::setw(24) << entry.first << " "
                  << stateToString(entry.second) << " (" << entry.second.line << ")" << std::endl;
    }
    return allSucceeded ? 0 : 1;
}

void BackupCLI::printProgress() const {
    for (const auto& entry : manager_->getStatus()) {
        if (!entry.second.isRunning()) {
            continue;
        }
        std::cout << "[" << std::right << std::setw(3) << static_cast<int>(entry.second.percent) << "%] "
                  << entry.first << ": " << entry.second.line;
        if (entry.second.state == RunState::Running) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now() - entry.second.startTime);
            std::cout << " (" << elapsed.count() << "s)";
        }
        std::cout << std::endl;
    }
}

void BackupCLI::printLogs(const std::vector<std::string>& names) const {
    for (const auto& name : names) {
        std::cout << manager_->getLogs(name);
    }
}

int BackupCLI::handleStatusCommand(int, char*[]) {
    for (const auto& backupSet : manager_->getBackupSets()) {
        std::cout << std::left << std::setw(24) << backupSet.name
                  << " " << std::setw(20) << manager_->getLastRunTime(backupSet.name)
                  << " " << backupSet.local << " -> " << backupSet.remote << std::endl;
    }

    const RunStatistics stats = manager_->getStatistics();
    std::cout << "\nTotal runs: " << stats.totalRuns
              << "  Successful: " << stats.successfulRuns
              << "  Failed: " << stats.failedRuns << std::endl;
    return 0;
}

int BackupCLI::handleHistoryCommand(int argc, char* argv[]) {
    size_t limit = 10;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-n" || arg == "--limit") && i + 1 < argc) {
            try {
                int value = std::stoi(argv[++i]);
                if (value < 0) {
                    throw std::out_of_range("negative limit");
                }
                limit = static_cast<size_t>(value);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid limit: " << argv[i] << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option for history: " << arg << std::endl;
            return 1;
        }
    }

    for (const auto& entry : manager_->getRecentHistory(limit)) {
        std::cout << HistoryStore::formatTimestamp(entry.timestamp) << "  "
                  << std::left << std::setw(24) << entry.name << " "
                  << (entry.success ? "SUCCESS" : "FAILED ") << " "
                  << std::fixed << std::setprecision(1) << entry.durationSeconds << "s" << std::endl;
    }
    return 0;
}

int BackupCLI::handleCheckCommand(int, char*[]) {
    std::string version;
    if (manager_->getRunner()->checkInstalled(version)) {
        std::cout << version << std::endl;
        return 0;
    }
    std::cerr << "Error: " << version << std::endl;
    return 1;
}

int BackupCLI::handleRemotesCommand(int, char*[]) {
    auto remotes = manager_->getRunner()->listRemotes();
    if (remotes.empty()) {
        std::cout << "No rclone remotes configured" << std::endl;
        return 0;
    }
    for (const auto& remote : remotes) {
        std::cout << remote << std::endl;
    }
    return 0;
}

int BackupCLI::handleAddCommand(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: rclone-backup-manager add NAME LOCAL REMOTE" << std::endl;
        return 1;
    }

    BackupSetConfig backupSet{argv[1], argv[2], argv[3]};
    if (!configManager_->addBackupSet(backupSet)) {
        std::cerr << "Error: " << configManager_->getLastError() << std::endl;
        return 1;
    }
    if (!configManager_->save()) {
        std::cerr << "Error: " << configManager_->getLastError() << std::endl;
        return 1;
    }
    manager_->reloadConfig();
    std::cout << "Saved backup set " << backupSet.name << std::endl;
    return 0;
}

int BackupCLI::handleRemoveCommand(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: rclone-backup-manager remove NAME" << std::endl;
        return 1;
    }

    if (!configManager_->removeBackupSet(argv[1]) || !configManager_->save()) {
        std::cerr << "Error: " << configManager_->getLastError() << std::endl;
        return 1;
    }
    manager_->reloadConfig();
    std::cout << "Removed backup set " << argv[1] << std::endl;
    return 0;
}

int BackupCLI::handleDaemonCommand(int, char*[]) {
    const AppSettings appSettings = manager_->getAppSettings();
    if (!appSettings.autoRunEnabled) {
        Logger::warning("auto_run_enabled is false in the configuration, running on the default interval anyway");
    }
    const int intervalMinutes = appSettings.autoRunIntervalMin > 0 ? appSettings.autoRunIntervalMin : 5;

    if (appSettings.showNotifications) {
        manager_->onBackupComplete([](const std::string& name, bool success) {
            Logger::info("Backup " + name + (success ? " completed successfully" : " failed"));
        });
    }

    auto runCycle = [this]() {
        if (!manager_->isRunning()) {
            Logger::info("Auto-run: Starting backup");
            manager_->startAll(false);
        } else {
            Logger::info("Auto-run: previous batch still running, skipping this cycle");
        }
    };

    Logger::info("Auto-run enabled: Every " + std::to_string(intervalMinutes) + " minutes");

    Scheduler scheduler;
    runCycle();
    scheduler.schedulePeriodicTask("auto-run", intervalMinutes * 60, runCycle);
    scheduler.start();

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
    while (!stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    Logger::info("Stopping auto-run scheduler");
    scheduler.stop();
    if (manager_->isRunning()) {
        Logger::info("Waiting for running backups to finish");
    }
    manager_->waitForAll();
    return 0;
}
