#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "../Types.hpp"
#include "VersionRecord.hpp"

// 引擎输出中提取的备份统计，不持久化
struct BackupStatistics {
    double changedFiles = 0;
    double changedSourceSize = 0;
    double incrementFileSize = 0;
    double totalDestinationSizeChange = 0;
    double elapsedSeconds = 0;
    std::optional<double> compressionRatioPercent;   // 增量大小 / 变化源大小 * 100
    std::optional<double> spaceSavingsPercent;       // 100 - 压缩率
    std::optional<double> sourceFiles;
    std::optional<double> sourceSize;
};

// 单次备份请求的引擎选项
struct BackupOptions {
    std::optional<bool> compression;        // 未设置时由调用方按文件大小决定
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;
    std::string tag;                        // 仅快照引擎使用
    bool force = false;
};

struct RestoreOptions {
    bool force = false;
    std::string assetFileName;    // 从目录级备份中恢复单个文件时使用
};

// 一个引擎原生的历史单元：差异引擎的增量或快照引擎的快照
struct Increment {
    std::string identifier;
    std::string timestamp;
    uint64_t sizeBytes = 0;
    bool isSnapshot = false;
    std::string description;
};

struct BackupResult {
    bool success = false;
    std::string stdOut;
    std::string stdErr;
    int exitCode = -1;
    std::string error;
    BackupState state = BackupState::IDLE;
    std::optional<BackupStatistics> statistics;
    std::optional<VersionRecord> versionInfo;
    std::string snapshotId;
    bool skipped = false;          // 因备份间隔下限被跳过
    std::string restoredPath;
};

// 资产的备份历史概览
struct AssetHistory {
    bool hasBackup = false;
    std::string repositoryPath;
    std::optional<BackupStatistics> statistics;
    std::vector<Increment> increments;
    std::vector<VersionRecord> versions;
    std::string currentVersion = "000";
};

// 库中一个已有备份的资产
struct BackedUpAsset {
    std::string logicalPath;
    std::string repositoryPath;
    std::string currentVersion = "000";
    size_t versionCount = 0;
    uint64_t repositorySizeBytes = 0;
};

// 所有仓库的汇总；平均节省率只统计引擎能给出该值的仓库
struct RepositorySummary {
    size_t repositoryCount = 0;
    uint64_t totalSizeBytes = 0;
    std::optional<double> averageSpaceSavingsPercent;
};
