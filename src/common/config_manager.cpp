#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <algorithm>

using json = nlohmann::json;

ConfigManager::ConfigManager(const std::string& configPath)
    : configPath_(configPath)
    , config_(getDefaultConfig()) {
    reload();
}

BackupManagerConfig ConfigManager::getDefaultConfig() {
    return BackupManagerConfig{};
}

BackupManagerConfig ConfigManager::fromJson(const json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("configuration root is not an object");
    }

    BackupManagerConfig config = getDefaultConfig();

    if (document.contains("backup_sets")) {
        for (const auto& item : document.at("backup_sets")) {
            BackupSetConfig backupSet;
            backupSet.name = item.value("name", std::string("unnamed"));
            backupSet.local = item.value("local", std::string());
            backupSet.remote = item.value("remote", std::string());
            config.backupSets.push_back(backupSet);
        }
    }

    if (document.contains("settings")) {
        const auto& settings = document.at("settings");
        config.settings.transfers = settings.value("transfers", config.settings.transfers);
        config.settings.checkers = settings.value("checkers", config.settings.checkers);
        config.settings.retries = settings.value("retries", config.settings.retries);
        config.settings.retriesSleep = settings.value("retries_sleep", config.settings.retriesSleep);
    }

    if (document.contains("app_settings")) {
        const auto& app = document.at("app_settings");
        AppSettings& out = config.appSettings;
        out.minimizeToTray = app.value("minimize_to_tray", out.minimizeToTray);
        out.startMinimized = app.value("start_minimized", out.startMinimized);
        out.autoRunEnabled = app.value("auto_run_enabled", out.autoRunEnabled);
        out.autoRunIntervalMin = app.value("auto_run_interval_min", out.autoRunIntervalMin);
        out.dryRun = app.value("dry_run", out.dryRun);
        out.theme = app.value("theme", out.theme);
        out.showNotifications = app.value("show_notifications", out.showNotifications);
    }

    return config;
}

json ConfigManager::toJson(const BackupManagerConfig& config) {
    json backupSets = json::array();
    for (const auto& backupSet : config.backupSets) {
        backupSets.push_back({
            {"name", backupSet.name},
            {"local", backupSet.local},
            {"remote", backupSet.remote}
        });
    }

    return {
        {"backup_sets", backupSets},
        {"settings", {
            {"transfers", config.settings.transfers},
            {"checkers", config.settings.checkers},
            {"retries", config.settings.retries},
            {"retries_sleep", config.settings.retriesSleep}
        }},
        {"app_settings", {
            {"minimize_to_tray", config.appSettings.minimizeToTray},
            {"start_minimized", config.appSettings.startMinimized},
            {"auto_run_enabled", config.appSettings.autoRunEnabled},
            {"auto_run_interval_min", config.appSettings.autoRunIntervalMin},
            {"dry_run", config.appSettings.dryRun},
            {"theme", config.appSettings.theme},
            {"show_notifications", config.appSettings.showNotifications}
        }}
    };
}

bool ConfigManager::reload() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!std::filesystem::exists(configPath_)) {
        Logger::info("No configuration at " + configPath_ + ", writing defaults");
        config_ = getDefaultConfig();
        return saveLocked();
    }

    try {
        std::ifstream file(configPath_);
        if (!file.is_open()) {
            lastError_ = "Failed to open configuration file: " + configPath_;
            Logger::error(lastError_);
            config_ = getDefaultConfig();
            return false;
        }
        json document;
        file >> document;
        config_ = fromJson(document);
        return true;
    } catch (const json::parse_error& e) {
        lastError_ = "Invalid JSON in config file: " + std::string(e.what());
    } catch (const std::exception& e) {
        lastError_ = "Failed to load config: " + std::string(e.what());
    }

    Logger::error(lastError_);
    config_ = getDefaultConfig();
    return false;
}

bool ConfigManager::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked();
}

bool ConfigManager::saveLocked() {
    try {
        std::filesystem::path dir = std::filesystem::path(configPath_).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir);
        }

        std::ofstream file(configPath_, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            lastError_ = "Failed to open configuration file for writing: " + configPath_;
            Logger::error(lastError_);
            return false;
        }
        file << toJson(config_).dump(2);
        if (!file) {
            lastError_ = "Failed to write configuration file: " + configPath_;
            Logger::error(lastError_);
            return false;
        }
        Logger::info("Configuration saved successfully");
        return true;
    } catch (const std::exception& e) {
        lastError_ = "Failed to save config: " + std::string(e.what());
        Logger::error(lastError_);
        return false;
    }
}

std::vector<BackupSetConfig> ConfigManager::getBackupSets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.backupSets;
}

TransferSettings ConfigManager::getSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.settings;
}

AppSettings ConfigManager::getAppSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.appSettings;
}

bool ConfigManager::addBackupSet(const BackupSetConfig& backupSet) {
    std::string error;
    if (!validateBackupSet(backupSet, error)) {
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = error;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(config_.backupSets.begin(), config_.backupSets.end(),
                           [&](const BackupSetConfig& existing) { return existing.name == backupSet.name; });
    if (it != config_.backupSets.end()) {
        *it = backupSet;
    } else {
        config_.backupSets.push_back(backupSet);
    }
    return true;
}

bool ConfigManager::removeBackupSet(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove_if(config_.backupSets.begin(), config_.backupSets.end(),
                             [&](const BackupSetConfig& existing) { return existing.name == name; });
    if (it == config_.backupSets.end()) {
        lastError_ = "No backup set named " + name;
        return false;
    }
    config_.backupSets.erase(it, config_.backupSets.end());
    return true;
}

void ConfigManager::setSettings(const TransferSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.settings = settings;
}

void ConfigManager::setAppSettings(const AppSettings& appSettings) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.appSettings = appSettings;
}

bool ConfigManager::validateBackupSet(const BackupSetConfig& backupSet, std::string& error) {
    if (backupSet.name.empty()) {
        error = "Name is required";
        return false;
    }
    if (backupSet.local.empty()) {
        error = "Local path is required";
        return false;
    }
    if (backupSet.remote.empty()) {
        error = "Remote path is required";
        return false;
    }
    if (backupSet.remote.find(':') == std::string::npos) {
        error = "Remote must include rclone remote name (e.g., myremote:path)";
        return false;
    }
    error.clear();
    return true;
}

std::string ConfigManager::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}
