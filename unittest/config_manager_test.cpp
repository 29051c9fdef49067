#include <gtest/gtest.h>
#include "common/config_manager.hpp"
#include "test_utils.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = makeTempDir("config-manager-test");
        configPath_ = (tempDir_ / "folders.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tempDir_, ec);
    }

    void writeConfig(const std::string& content) {
        std::ofstream out(configPath_);
        out << content;
    }

    std::filesystem::path tempDir_;
    std::string configPath_;
};

TEST_F(ConfigManagerTest, MissingFileWritesDefaults) {
    ConfigManager config(configPath_);

    EXPECT_TRUE(std::filesystem::exists(configPath_));
    EXPECT_TRUE(config.getBackupSets().empty());
    TransferSettings settings = config.getSettings();
    EXPECT_EQ(settings.transfers, 8);
    EXPECT_EQ(settings.checkers, 8);
    EXPECT_EQ(settings.retries, 3);
    EXPECT_EQ(settings.retriesSleep, "10s");
    EXPECT_EQ(config.getAppSettings().autoRunIntervalMin, 5);

    nlohmann::json written = nlohmann::json::parse(readFile(configPath_));
    EXPECT_TRUE(written["backup_sets"].is_array());
    EXPECT_EQ(written["settings"]["retries_sleep"], "10s");
    EXPECT_EQ(written["app_settings"]["theme"], "cosmo");
}

TEST_F(ConfigManagerTest, InvalidJsonFallsBackToDefaults) {
    writeConfig("{ \"backup_sets\": [ ");

    ConfigManager config(configPath_);

    EXPECT_TRUE(config.getBackupSets().empty());
    EXPECT_EQ(config.getSettings().transfers, 8);
    EXPECT_NE(config.getLastError().find("Invalid JSON"), std::string::npos);
}

TEST_F(ConfigManagerTest, FillsMissingSectionsAndKeys) {
    writeConfig(R"({
        "backup_sets": [
            {"name": "docs", "local": "/home/me/Docs", "remote": "gdrive:backup"},
            {"local": "/home/me/Music", "remote": "gdrive:"}
        ],
        "app_settings": {"auto_run_enabled": true}
    })");

    ConfigManager config(configPath_);

    auto sets = config.getBackupSets();
    ASSERT_EQ(sets.size(), 2u);
    EXPECT_EQ(sets[0].name, "docs");
    EXPECT_EQ(sets[0].local, "/home/me/Docs");
    EXPECT_EQ(sets[0].remote, "gdrive:backup");
    EXPECT_EQ(sets[1].name, "unnamed");

    EXPECT_EQ(config.getSettings().checkers, 8);
    AppSettings app = config.getAppSettings();
    EXPECT_TRUE(app.autoRunEnabled);
    EXPECT_EQ(app.autoRunIntervalMin, 5);
    EXPECT_TRUE(app.showNotifications);
}

TEST_F(ConfigManagerTest, ReadsTransferSettings) {
    writeConfig(R"({"settings": {"transfers": 2, "checkers": 16, "retries": 0, "retries_sleep": "1m"}})");

    ConfigManager config(configPath_);

    TransferSettings settings = config.getSettings();
    EXPECT_EQ(settings.transfers, 2);
    EXPECT_EQ(settings.checkers, 16);
    EXPECT_EQ(settings.retries, 0);
    EXPECT_EQ(settings.retriesSleep, "1m");
}

TEST_F(ConfigManagerTest, ValidateBackupSet) {
    std::string error;
    EXPECT_TRUE(ConfigManager::validateBackupSet({"docs", "/home/me/Docs", "gdrive:docs"}, error));
    EXPECT_TRUE(error.empty());

    EXPECT_FALSE(ConfigManager::validateBackupSet({"", "/a", "r:b"}, error));
    EXPECT_EQ(error, "Name is required");
    EXPECT_FALSE(ConfigManager::validateBackupSet({"n", "", "r:b"}, error));
    EXPECT_EQ(error, "Local path is required");
    EXPECT_FALSE(ConfigManager::validateBackupSet({"n", "/a", ""}, error));
    EXPECT_EQ(error, "Remote path is required");
    EXPECT_FALSE(ConfigManager::validateBackupSet({"n", "/a", "/mnt/disk"}, error));
    EXPECT_NE(error.find("remote name"), std::string::npos);
}

TEST_F(ConfigManagerTest, AddRemoveAndSave) {
    ConfigManager config(configPath_);

    EXPECT_TRUE(config.addBackupSet({"docs", "/home/me/Docs", "gdrive:docs"}));
    EXPECT_TRUE(config.addBackupSet({"docs", "/home/me/Documents", "gdrive:docs"}));
    EXPECT_FALSE(config.addBackupSet({"bad", "/x", "no-colon"}));
    ASSERT_EQ(config.getBackupSets().size(), 1u);
    EXPECT_EQ(config.getBackupSets()[0].local, "/home/me/Documents");
    ASSERT_TRUE(config.save());

    ConfigManager reloaded(configPath_);
    ASSERT_EQ(reloaded.getBackupSets().size(), 1u);
    EXPECT_EQ(reloaded.getBackupSets()[0].name, "docs");

    EXPECT_TRUE(reloaded.removeBackupSet("docs"));
    EXPECT_FALSE(reloaded.removeBackupSet("docs"));
    EXPECT_TRUE(reloaded.getBackupSets().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
