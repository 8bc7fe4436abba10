#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "Types.hpp"
#include "../utils/ILogger.hpp"

// 运行配置，核心组件只读
struct AppConfig {
    EngineKind engineKind = EngineKind::SNAPSHOT;
    std::string enginePath;                     // 空表示使用引擎的默认可执行文件名
    StorageMode storageMode = StorageMode::ADJACENT;
    std::string vaultRoot;                      // 空表示当前目录
    std::string globalBackupRoot;               // global 模式必填
    uint64_t compressionThresholdBytes = 1024 * 1024;
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;
    std::vector<std::string> backupFileExtensions = {
        ".blend", ".psd", ".kra", ".xcf", ".pdf", ".ai", ".svg",
        ".indd", ".afphoto", ".afdesign", ".afpub"
    };
    bool preventDuplicateBackups = true;
    int minBackupIntervalSeconds = 60;
    int autoBackupDelayMs = 2000;
    int processTimeoutMs = 0;                   // 0 表示不限时
    LogLevel logLevel = LogLevel::INFO;
};
