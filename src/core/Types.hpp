#pragma once
#include <stdexcept>
#include <string>

// 配置错误：路径无法解析、未知的存储模式或引擎类型等
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class EngineKind {
    DIFF,
    SNAPSHOT
};

enum class StorageMode {
    ADJACENT,
    GLOBAL
};

// 单次备份调用的状态机
enum class BackupState {
    IDLE,
    COMMAND_BUILDING,
    EXECUTING,
    SUCCESS,
    WARNING_RECOVERED,
    HARD_FAILURE
};

inline std::string toString(EngineKind kind) {
    switch (kind) {
        case EngineKind::DIFF: return "diff";
        case EngineKind::SNAPSHOT: return "snapshot";
        default: return "unknown";
    }
}

inline std::string toString(StorageMode mode) {
    switch (mode) {
        case StorageMode::ADJACENT: return "adjacent";
        case StorageMode::GLOBAL: return "global";
        default: return "unknown";
    }
}

inline std::string toString(BackupState state) {
    switch (state) {
        case BackupState::IDLE: return "IDLE";
        case BackupState::COMMAND_BUILDING: return "COMMAND_BUILDING";
        case BackupState::EXECUTING: return "EXECUTING";
        case BackupState::SUCCESS: return "SUCCESS";
        case BackupState::WARNING_RECOVERED: return "WARNING_RECOVERED";
        case BackupState::HARD_FAILURE: return "HARD_FAILURE";
        default: return "UNKNOWN";
    }
}

inline EngineKind parseEngineKind(const std::string& text) {
    if (text == "diff" || text == "rdiff-backup") {
        return EngineKind::DIFF;
    }
    if (text == "snapshot" || text == "restic") {
        return EngineKind::SNAPSHOT;
    }
    throw ConfigurationError("Unknown engine kind: '" + text + "'");
}

inline StorageMode parseStorageMode(const std::string& text) {
    if (text == "adjacent") {
        return StorageMode::ADJACENT;
    }
    if (text == "global") {
        return StorageMode::GLOBAL;
    }
    throw ConfigurationError("Unknown storage mode: '" + text + "'");
}
