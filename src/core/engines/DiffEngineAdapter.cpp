#include "DiffEngineAdapter.hpp"
#include "../../utils/ILogger.hpp"
#include "../../utils/FileSystem.hpp"
#include <regex>
#include <sstream>

const char* const DiffEngineAdapter::kApiVersion = "201";
const char* const DiffEngineAdapter::kDataDirectory = "rdiff-backup-data";

namespace {

const std::regex kIncrementPattern(
    R"(increments\.(\d{4}-\d{2}-\d{2}T\d{2}-\d{2}-\d{2}[+-]\d{2}-\d{2})\.dir)");
const std::regex kIncrementTimestamp(
    R"(^(\d{4}-\d{2}-\d{2})T(\d{2})-(\d{2})-(\d{2})([+-])(\d{2})-(\d{2})$)");

const char* const kSessionStatisticsPrefix = "session_statistics.";
const char* const kSessionStatisticsSuffix = ".data";

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

BackupResult failure(const std::string& message) {
    BackupResult result;
    result.success = false;
    result.exitCode = -1;
    result.error = message;
    result.stdErr = message;
    result.state = BackupState::HARD_FAILURE;
    return result;
}

} // namespace

DiffEngineAdapter::DiffEngineAdapter(std::shared_ptr<ProcessRunner> runner, const std::string& executablePath,
                                     ILogger* log, int timeoutMs)
    : processRunner(std::move(runner)), executable(executablePath), logger(log),
      timeoutMs(timeoutMs), parser(log) {}

EngineKind DiffEngineAdapter::getKind() const {
    return EngineKind::DIFF;
}

const std::string& DiffEngineAdapter::getExecutablePath() const {
    return executable;
}

void DiffEngineAdapter::setExecutablePath(const std::string& path) {
    executable = path;
}

std::vector<std::string> DiffEngineAdapter::buildBackupArguments(const std::string& sourceDirectory,
                                                                 const std::string& repositoryPath,
                                                                 const BackupOptions& options) {
    std::vector<std::string> args = {"--api-version", kApiVersion};
    // --force 是全局参数，必须出现在子命令之前
    if (options.force) {
        args.push_back("--force");
    }
    args.push_back("backup");
    args.push_back("--create-full-path");

    if (options.compression.has_value()) {
        args.push_back(*options.compression ? "--compression" : "--no-compression");
    }

    // 引擎按出现顺序匹配选择规则，include 必须在 exclude 之前
    for (const auto& pattern : options.includePatterns) {
        args.push_back("--include");
        args.push_back(pattern);
    }
    for (const auto& pattern : options.excludePatterns) {
        args.push_back("--exclude");
        args.push_back(pattern);
    }

    args.push_back(FileSystem::toGenericPath(sourceDirectory));
    args.push_back(FileSystem::toGenericPath(repositoryPath));
    return args;
}

std::vector<std::string> DiffEngineAdapter::buildRestoreArguments(const std::string& repositoryPath,
                                                                  const std::string& selector,
                                                                  const std::string& targetPath,
                                                                  const RestoreOptions& options) {
    std::vector<std::string> args = {"--api-version", kApiVersion};
    if (options.force) {
        args.push_back("--force");
    }
    args.push_back("restore");
    if (!selector.empty() && selector != "latest") {
        args.push_back("--at");
        args.push_back(selector);
    }

    fs::path source(repositoryPath);
    if (!options.assetFileName.empty()) {
        source /= options.assetFileName;
    }
    args.push_back(FileSystem::toGenericPath(source.string()));
    args.push_back(FileSystem::toGenericPath(targetPath));
    return args;
}

std::string DiffEngineAdapter::reformatIncrementTimestamp(const std::string& raw) {
    std::smatch match;
    if (!std::regex_match(raw, match, kIncrementTimestamp)) {
        return raw;
    }
    return match[1].str() + "T" + match[2].str() + ":" + match[3].str() + ":" + match[4].str() +
           match[5].str() + match[6].str() + ":" + match[7].str();
}

std::vector<Increment> DiffEngineAdapter::parseIncrements(const std::string& output) {
    std::vector<Increment> increments;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        // 标题行与当前镜像行不是增量
        if (line.find("Found") != std::string::npos || line.find("Current mirror") != std::string::npos) {
            continue;
        }

        std::smatch match;
        if (!std::regex_search(line, match, kIncrementPattern)) {
            continue;
        }

        Increment increment;
        increment.timestamp = reformatIncrementTimestamp(match[1].str());
        increment.identifier = increment.timestamp;
        increment.isSnapshot = line.find("snapshot") != std::string::npos;
        size_t first = line.find_first_not_of(" \t");
        size_t last = line.find_last_not_of(" \t\r");
        increment.description = line.substr(first, last - first + 1);
        increments.push_back(increment);
    }
    return increments;
}

ProcessResult DiffEngineAdapter::execute(const std::vector<std::string>& args) {
    ProcessOptions options;
    options.timeoutMs = timeoutMs;
    return processRunner->run(executable, args, options);
}

bool DiffEngineAdapter::hasRepository(const std::string& repositoryPath) const {
    return FileSystem::isDirectory((fs::path(repositoryPath) / kDataDirectory).string());
}

BackupResult DiffEngineAdapter::backup(const std::string& sourcePath, const std::string& repositoryPath,
                                       const BackupOptions& options) {
    return runBackup(sourcePath, repositoryPath, options);
}

BackupResult DiffEngineAdapter::backupAdjacent(const std::string& sourcePath, const std::string& repositoryPath,
                                               const BackupOptions& options) {
    // 相邻模式下首次备份时源目录与仓库同属一个父目录，引擎需要 --force 才会执行
    BackupOptions adjacentOptions = options;
    adjacentOptions.force = true;
    logger->info("Adjacent backup of " + fs::path(sourcePath).filename().string() + " (using --force)");
    return runBackup(sourcePath, repositoryPath, adjacentOptions);
}

BackupResult DiffEngineAdapter::runBackup(const std::string& sourcePath, const std::string& repositoryPath,
                                          const BackupOptions& options) {
    if (!FileSystem::isRegularFile(sourcePath)) {
        logger->error("Backup source is not a regular file: " + sourcePath);
        return failure("Source file does not exist: " + sourcePath);
    }

    // 引擎只能备份目录：备份父目录，只包含目标文件，排除其余所有内容
    fs::path source(sourcePath);
    std::string parentDirectory = source.parent_path().string();
    std::string fileName = FileSystem::toGenericPath(source.filename().string());

    BackupOptions engineOptions = options;
    engineOptions.includePatterns.clear();
    engineOptions.includePatterns.push_back("**/" + fileName);
    for (const auto& pattern : options.includePatterns) {
        engineOptions.includePatterns.push_back(pattern);
    }
    engineOptions.excludePatterns.push_back("**");

    logger->info("Backing up single file: **/" + fileName + " from directory: " + parentDirectory);

    ProcessResult processResult = execute(buildBackupArguments(parentDirectory, repositoryPath, engineOptions));
    BackupResult result = toBackupResult(processResult);

    if (!processResult.success) {
        // 退出码1表示“完成但有警告”，数据目录存在即视为成功
        if (processResult.exitCode == 1 && hasRepository(repositoryPath)) {
            result.success = true;
            result.error.clear();
            result.state = BackupState::WARNING_RECOVERED;
            logger->info("Backup completed despite warnings (exit code 1) for " + fileName);
        } else {
            logger->error("Backup failed for " + fileName + ": " + result.error);
            return result;
        }
    } else {
        logger->info("Backup completed successfully for " + fileName);
    }

    result.statistics = repositoryStatistics(repositoryPath);
    return result;
}

BackupResult DiffEngineAdapter::restore(const std::string& repositoryPath, const std::string& selector,
                                        const std::string& targetPath, const RestoreOptions& options) {
    if (!hasRepository(repositoryPath)) {
        logger->error("No diff engine repository at " + repositoryPath);
        return failure("No backup repository found at " + repositoryPath);
    }

    ProcessResult processResult = execute(buildRestoreArguments(repositoryPath, selector, targetPath, options));
    BackupResult result = toBackupResult(processResult);
    if (result.success) {
        result.restoredPath = targetPath;
        logger->info("Restore completed successfully to " + targetPath);
    }
    return result;
}

std::vector<Increment> DiffEngineAdapter::listIncrements(const std::string& repositoryPath) {
    if (!hasRepository(repositoryPath)) {
        return {};
    }

    ProcessResult processResult = execute({"--api-version", kApiVersion, "list", "increments",
                                           FileSystem::toGenericPath(repositoryPath)});
    if (!processResult.success) {
        logger->warn("Failed to list increments: " + processResult.stdErr);
        return {};
    }

    std::vector<Increment> increments = parseIncrements(processResult.stdOut);
    if (increments.empty()) {
        logger->debug("No increments found in list output for " + repositoryPath);
    }
    return increments;
}

BackupResult DiffEngineAdapter::verify(const std::string& repositoryPath) {
    BackupResult result = toBackupResult(
        execute({"--api-version", kApiVersion, "verify", FileSystem::toGenericPath(repositoryPath)}));
    if (result.success) {
        logger->info("Repository verification completed successfully");
    }
    return result;
}

BackupResult DiffEngineAdapter::info(const std::string& repositoryPath) {
    return toBackupResult(
        execute({"--api-version", kApiVersion, "info", FileSystem::toGenericPath(repositoryPath)}));
}

std::optional<std::string> DiffEngineAdapter::latestSessionStatisticsFile(const std::string& repositoryPath) const {
    fs::path dataDirectory = fs::path(repositoryPath) / kDataDirectory;
    std::optional<std::string> latest;
    // listDirectory 返回排序后的名称，最后一个匹配的就是最新的
    for (const auto& name : FileSystem::listDirectory(dataDirectory.string())) {
        if (name.rfind(kSessionStatisticsPrefix, 0) == 0 && endsWith(name, kSessionStatisticsSuffix)) {
            latest = (dataDirectory / name).string();
        }
    }
    return latest;
}

std::optional<BackupStatistics> DiffEngineAdapter::repositoryStatistics(const std::string& repositoryPath) {
    std::optional<std::string> statisticsFile = latestSessionStatisticsFile(repositoryPath);
    if (!statisticsFile) {
        logger->warn("No session statistics found in " + repositoryPath);
        return std::nullopt;
    }

    std::string content;
    if (!FileSystem::readTextFile(*statisticsFile, content)) {
        logger->warn("Failed to read session statistics: " + *statisticsFile);
        return std::nullopt;
    }
    return parser.parseDiffStatistics(content);
}

bool DiffEngineAdapter::probe(const std::string& executablePath) {
    ProcessOptions options;
    options.timeoutMs = timeoutMs;
    ProcessResult result = processRunner->run(executablePath, {"--version"}, options);
    bool valid = result.success && result.stdOut.find("rdiff-backup") != std::string::npos;
    logger->debug("rdiff-backup probe of " + executablePath + ": " + (valid ? "ok" : "failed"));
    return valid;
}
