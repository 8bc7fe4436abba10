#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "utils/ConfigLoader.hpp"

namespace fs = std::filesystem;

TEST(ConfigLoaderTest, DefaultsWhenKeysAbsent) {
    AppConfig config = ConfigLoader::loadFromString("{}");
    EXPECT_EQ(EngineKind::SNAPSHOT, config.engineKind);
    EXPECT_EQ(StorageMode::ADJACENT, config.storageMode);
    EXPECT_EQ(1024u * 1024u, config.compressionThresholdBytes);
    EXPECT_TRUE(config.preventDuplicateBackups);
    EXPECT_EQ(60, config.minBackupIntervalSeconds);
    EXPECT_EQ(LogLevel::INFO, config.logLevel);
}

TEST(ConfigLoaderTest, ReadsAllKeys) {
    AppConfig config = ConfigLoader::loadFromString(R"({
        "engineKind": "rdiff-backup",
        "enginePath": "/usr/bin/rdiff-backup",
        "storageMode": "global",
        "vaultRoot": "/vault",
        "globalBackupRoot": "/backups",
        "compressionThresholdBytes": 2048,
        "includePatterns": ["**/*.png"],
        "excludePatterns": ["**/*.tmp", "**/*.bak"],
        "backupFileExtensions": [".blend"],
        "preventDuplicateBackups": false,
        "minBackupIntervalSeconds": 5,
        "autoBackupDelayMs": 250,
        "processTimeoutMs": 60000,
        "logLevel": "debug",
        "somethingUnknown": 1
    })");

    EXPECT_EQ(EngineKind::DIFF, config.engineKind);
    EXPECT_EQ("/usr/bin/rdiff-backup", config.enginePath);
    EXPECT_EQ(StorageMode::GLOBAL, config.storageMode);
    EXPECT_EQ("/vault", config.vaultRoot);
    EXPECT_EQ("/backups", config.globalBackupRoot);
    EXPECT_EQ(2048u, config.compressionThresholdBytes);
    ASSERT_EQ(2u, config.excludePatterns.size());
    EXPECT_EQ("**/*.bak", config.excludePatterns[1]);
    ASSERT_EQ(1u, config.backupFileExtensions.size());
    EXPECT_FALSE(config.preventDuplicateBackups);
    EXPECT_EQ(5, config.minBackupIntervalSeconds);
    EXPECT_EQ(250, config.autoBackupDelayMs);
    EXPECT_EQ(60000, config.processTimeoutMs);
    EXPECT_EQ(LogLevel::DEBUG, config.logLevel);
}

TEST(ConfigLoaderTest, AppliesOnTopOfBase) {
    AppConfig base;
    base.vaultRoot = "/base-vault";
    AppConfig config = ConfigLoader::loadFromString(R"({"storageMode": "adjacent"})", base);
    EXPECT_EQ("/base-vault", config.vaultRoot);
}

TEST(ConfigLoaderTest, InvalidValuesAreConfigurationErrors) {
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"storageMode": "sideways"})"), ConfigurationError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"engineKind": "tar"})"), ConfigurationError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"logLevel": "loud"})"), ConfigurationError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"minBackupIntervalSeconds": -1})"), ConfigurationError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"vaultRoot": 42})"), ConfigurationError);
    EXPECT_THROW(ConfigLoader::loadFromString("[1, 2]"), ConfigurationError);
    EXPECT_THROW(ConfigLoader::loadFromString("{ broken"), ConfigurationError);
}

TEST(ConfigLoaderTest, LoadsFromFile) {
    fs::path path = fs::temp_directory_path() / "assetkeeper_config_test.json";
    std::ofstream(path) << R"({"engineKind": "snapshot", "minBackupIntervalSeconds": 30})";

    AppConfig config = ConfigLoader::loadFromFile(path.string());
    EXPECT_EQ(EngineKind::SNAPSHOT, config.engineKind);
    EXPECT_EQ(30, config.minBackupIntervalSeconds);

    fs::remove(path);
    EXPECT_THROW(ConfigLoader::loadFromFile(path.string()), ConfigurationError);
}

TEST(ConfigLoaderTest, LogLevelNames) {
    EXPECT_EQ(LogLevel::WARNING, ConfigLoader::parseLogLevel("warn"));
    EXPECT_EQ(LogLevel::WARNING, ConfigLoader::parseLogLevel("warning"));
    EXPECT_EQ(LogLevel::ERROR_LEVEL, ConfigLoader::parseLogLevel("error"));
}
