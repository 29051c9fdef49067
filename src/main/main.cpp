#include "backup/backup_cli.hpp"
#include "backup/backup_manager.hpp"
#include "backup/rclone_runner.hpp"
#include "common/config_manager.hpp"
#include "common/history_store.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <filesystem>
#include <cstdlib>
#include <memory>
#include <string>

namespace {

const char* kVersion = "2.2.0";

std::string defaultDataDir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME")) {
        if (*xdg) {
            return (std::filesystem::path(xdg) / "rclone-backup-manager").string();
        }
    }
    if (const char* home = std::getenv("HOME")) {
        if (*home) {
            return (std::filesystem::path(home) / ".local" / "share" / "rclone-backup-manager").string();
        }
    }
    return "data";
}

} // namespace

int main(int argc, char** argv) {
    std::string dataDir = defaultDataDir();
    std::string configPath;
    std::string rcloneExecutable = "rclone";
    LogLevel logLevel = LogLevel::INFO;

    // Global options come before the command
    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            BackupCLI::printUsage();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "rclone-backup-manager version " << kVersion << "\n";
            return 0;
        } else if (arg == "--data-dir" && i + 1 < argc) {
            dataDir = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--rclone" && i + 1 < argc) {
            rcloneExecutable = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            std::string level = argv[++i];
            if (!Logger::parseLevel(level, logLevel)) {
                std::cerr << "Error: Unknown log level: " << level << std::endl;
                return 1;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            BackupCLI::printUsage();
            return 1;
        } else {
            break;
        }
    }

    if (i >= argc) {
        std::cerr << "Error: No command specified" << std::endl;
        BackupCLI::printUsage();
        return 1;
    }

    const std::filesystem::path dataPath(dataDir);
    if (configPath.empty()) {
        configPath = (dataPath / "folders.json").string();
    }

    if (!Logger::initialize((dataPath / "rclone-backup-manager.log").string(), logLevel, false)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }

    int rc = 1;
    try {
        auto configManager = std::make_shared<ConfigManager>(configPath);
        auto history = std::make_shared<HistoryStore>((dataPath / "data" / "state.json").string());
        auto runner = std::make_shared<RcloneRunner>(rcloneExecutable);
        auto manager = std::make_shared<BackupManager>(
            configManager, history, (dataPath / ".first_run_done").string(), runner);

        BackupCLI cli(manager, configManager);
        rc = cli.run(argc - i, argv + i);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
        rc = 1;
    }

    Logger::shutdown();
    return rc;
}
