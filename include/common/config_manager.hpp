#pragma once

#include "backup/backup_config.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>

// Read-only view of the configuration consumed by the backup manager
class ConfigProvider {
public:
    virtual ~ConfigProvider() = default;

    virtual bool reload() = 0;
    virtual std::vector<BackupSetConfig> getBackupSets() const = 0;
    virtual TransferSettings getSettings() const = 0;
    virtual AppSettings getAppSettings() const = 0;
};

// JSON configuration file (backup sets, rclone settings, app settings)
class ConfigManager : public ConfigProvider {
public:
    explicit ConfigManager(const std::string& configPath);

    bool reload() override;
    std::vector<BackupSetConfig> getBackupSets() const override;
    TransferSettings getSettings() const override;
    AppSettings getAppSettings() const override;

    bool save();

    bool addBackupSet(const BackupSetConfig& backupSet);
    bool removeBackupSet(const std::string& name);
    void setSettings(const TransferSettings& settings);
    void setAppSettings(const AppSettings& appSettings);

    static BackupManagerConfig getDefaultConfig();
    static bool validateBackupSet(const BackupSetConfig& backupSet, std::string& error);
    static BackupManagerConfig fromJson(const nlohmann::json& document);
    static nlohmann::json toJson(const BackupManagerConfig& config);

    const std::string& getConfigPath() const { return configPath_; }
    std::string getLastError() const;

private:
    bool saveLocked();

    std::string configPath_;
    BackupManagerConfig config_;
    std::string lastError_;
    mutable std::mutex mutex_;
};
