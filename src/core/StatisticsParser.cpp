#include "StatisticsParser.hpp"
#include "../utils/ILogger.hpp"
#include <regex>
#include <sstream>
#include <cstdlib>

namespace {

// 快照引擎摘要行的模式集中放在这里，输出格式变化时只需修改此处
const std::regex kSnapshotFilesLine(R"(Files:\s*(\d+)\s*new,\s*(\d+)\s*changed,\s*(\d+)\s*unmodified)");
const std::regex kSnapshotAddedLine(R"(Added to the repository:\s*([\d.]+)\s*([KMGT]?iB|B))");
const std::regex kSnapshotProcessedLine(
    R"(processed\s+(\d+)\s+files?,\s*([\d.]+)\s*([KMGT]?iB|B)\s+in\s+(\d+):(\d+)(?::(\d+))?)");
const std::regex kSnapshotTotalFiles(R"(Total File Count:\s*(\d+))");
const std::regex kSnapshotTotalSize(R"(Total Size:\s*([\d.]+)\s*([KMGT]?iB|B))");

// 差异引擎数值："12345 (12.06 KB)" 中的原始数值与括号内的可读数值
const std::regex kDiffLeadingNumber(R"(^\s*(-?\d+(?:\.\d+)?))");
const std::regex kDiffParenthesized(R"(\((-?\d+(?:\.\d+)?))");

double toDouble(const std::string& text) {
    return std::strtod(text.c_str(), nullptr);
}

struct DiffValue {
    bool found = false;
    double raw = 0;
    double display = 0;
};

DiffValue parseDiffValue(const std::string& rest) {
    DiffValue value;
    std::smatch match;
    if (std::regex_search(rest, match, kDiffLeadingNumber)) {
        value.found = true;
        value.raw = toDouble(match[1].str());
        value.display = value.raw;
    }
    if (std::regex_search(rest, match, kDiffParenthesized)) {
        value.found = true;
        value.display = toDouble(match[1].str());
    }
    return value;
}

} // namespace

StatisticsParser::StatisticsParser(ILogger* log) : logger(log) {}

BackupStatistics StatisticsParser::parse(EngineKind kind, const std::string& rawOutput) const {
    if (kind == EngineKind::DIFF) {
        return parseDiffStatistics(rawOutput);
    }
    return parseSnapshotOutput(rawOutput);
}

double StatisticsParser::unitToBytes(double value, const std::string& unit) {
    if (unit == "KiB") return value * 1024.0;
    if (unit == "MiB") return value * 1024.0 * 1024.0;
    if (unit == "GiB") return value * 1024.0 * 1024.0 * 1024.0;
    if (unit == "TiB") return value * 1024.0 * 1024.0 * 1024.0 * 1024.0;
    return value;
}

void StatisticsParser::applyDerivedRatios(BackupStatistics& stats, double incrementBytes, double changedSourceBytes) {
    if (changedSourceBytes == 0) {
        stats.compressionRatioPercent.reset();
        stats.spaceSavingsPercent.reset();
        return;
    }
    double ratio = incrementBytes / changedSourceBytes * 100.0;
    stats.compressionRatioPercent = ratio;
    stats.spaceSavingsPercent = 100.0 - ratio;
}

BackupStatistics StatisticsParser::parseDiffStatistics(const std::string& content) const {
    BackupStatistics stats;
    double rawIncrement = 0;
    double rawChangedSource = 0;
    bool matchedAny = false;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream lineStream(line);
        std::string key;
        if (!(lineStream >> key)) {
            continue;
        }
        std::string rest;
        std::getline(lineStream, rest);
        DiffValue value = parseDiffValue(rest);
        if (!value.found) {
            continue;
        }

        if (key == "ChangedFiles") {
            stats.changedFiles = value.raw;
        } else if (key == "ChangedSourceSize") {
            stats.changedSourceSize = value.display;
            rawChangedSource = value.raw;
        } else if (key == "IncrementFileSize") {
            stats.incrementFileSize = value.display;
            rawIncrement = value.raw;
        } else if (key == "TotalDestinationSizeChange") {
            stats.totalDestinationSizeChange = value.display;
        } else if (key == "ElapsedTime") {
            stats.elapsedSeconds = value.raw;
        } else if (key == "SourceFiles") {
            stats.sourceFiles = value.raw;
        } else if (key == "SourceFileSize") {
            stats.sourceSize = value.raw;
        } else {
            // 未识别的键忽略，兼容引擎版本变化
            continue;
        }
        matchedAny = true;
    }

    if (!matchedAny && logger) {
        logger->warn("No recognized statistics found in diff engine session statistics");
    }

    applyDerivedRatios(stats, rawIncrement, rawChangedSource);
    return stats;
}

BackupStatistics StatisticsParser::parseSnapshotOutput(const std::string& output) const {
    BackupStatistics stats;
    std::smatch match;
    bool matchedAny = false;

    if (std::regex_search(output, match, kSnapshotFilesLine)) {
        double newFiles = toDouble(match[1].str());
        double changed = toDouble(match[2].str());
        double unmodified = toDouble(match[3].str());
        stats.changedFiles = newFiles + changed;
        stats.sourceFiles = newFiles + changed + unmodified;
        matchedAny = true;
    }

    if (std::regex_search(output, match, kSnapshotAddedLine)) {
        double added = unitToBytes(toDouble(match[1].str()), match[2].str());
        stats.incrementFileSize = added;
        stats.totalDestinationSizeChange = added;
        matchedAny = true;
    }

    if (std::regex_search(output, match, kSnapshotProcessedLine)) {
        double processed = unitToBytes(toDouble(match[2].str()), match[3].str());
        stats.changedSourceSize = processed;
        stats.sourceSize = processed;
        double first = toDouble(match[4].str());
        double second = toDouble(match[5].str());
        if (match[6].matched) {
            // H:MM:SS
            stats.elapsedSeconds = first * 3600 + second * 60 + toDouble(match[6].str());
        } else {
            stats.elapsedSeconds = first * 60 + second;
        }
        matchedAny = true;
    }

    if (!matchedAny && logger) {
        logger->warn("No recognized summary lines found in snapshot engine output");
    }

    applyDerivedRatios(stats, stats.incrementFileSize, stats.changedSourceSize);
    return stats;
}

std::optional<BackupStatistics> StatisticsParser::parseSnapshotRepositoryStats(const std::string& output) const {
    BackupStatistics stats;
    std::smatch match;
    bool matchedAny = false;

    if (std::regex_search(output, match, kSnapshotTotalFiles)) {
        stats.sourceFiles = toDouble(match[1].str());
        matchedAny = true;
    }
    if (std::regex_search(output, match, kSnapshotTotalSize)) {
        stats.sourceSize = unitToBytes(toDouble(match[1].str()), match[2].str());
        matchedAny = true;
    }

    if (!matchedAny) {
        if (logger) {
            logger->warn("No repository totals found in snapshot engine stats output");
        }
        return std::nullopt;
    }
    return stats;
}
