#pragma once

#include <string>
#include <vector>

struct BackupSetConfig {
    std::string name;
    std::string local;   // Source folder
    std::string remote;  // "remotename:path", path may be empty
};

// Global rclone transfer options
struct TransferSettings {
    int transfers = 8;
    int checkers = 8;
    int retries = 3;
    std::string retriesSleep = "10s";
};

struct AppSettings {
    bool minimizeToTray = true;
    bool startMinimized = false;
    bool autoRunEnabled = false;
    int autoRunIntervalMin = 5;
    bool dryRun = false;
    std::string theme = "cosmo";
    bool showNotifications = true;
};

struct BackupManagerConfig {
    std::vector<BackupSetConfig> backupSets;
    TransferSettings settings;
    AppSettings appSettings;
};
