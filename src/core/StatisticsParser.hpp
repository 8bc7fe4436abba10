#pragma once
#include <string>
#include <optional>
#include "Types.hpp"
#include "models/BackupResult.hpp"

class ILogger;

// 从引擎输出中提取备份统计；纯函数，解析失败时字段保持为0，不抛异常
class StatisticsParser {
public:
    explicit StatisticsParser(ILogger* log = nullptr);

    BackupStatistics parse(EngineKind kind, const std::string& rawOutput) const;

    // 差异引擎 session_statistics 文件："Key value (N.NN unit)"
    BackupStatistics parseDiffStatistics(const std::string& content) const;

    // 快照引擎 backup 命令的实时输出
    BackupStatistics parseSnapshotOutput(const std::string& output) const;

    // 快照引擎 stats 命令输出中的 "Total File Count:" / "Total Size:"
    std::optional<BackupStatistics> parseSnapshotRepositoryStats(const std::string& output) const;

    // KiB/MiB/GiB/TiB 按 1024 进制换算，B 或未知单位原样返回
    static double unitToBytes(double value, const std::string& unit);

    // 增量大小 / 变化源大小；变化源大小为0时两个比例都不设置
    static void applyDerivedRatios(BackupStatistics& stats, double incrementBytes, double changedSourceBytes);

private:
    ILogger* logger;
};
