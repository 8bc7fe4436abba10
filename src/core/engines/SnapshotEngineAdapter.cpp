#include "SnapshotEngineAdapter.hpp"
#include "../../utils/ILogger.hpp"
#include "../../utils/FileSystem.hpp"
#include <nlohmann/json.hpp>
#include <regex>

const char* const SnapshotEngineAdapter::kRepositoryDirectory = "restic-repository";
const char* const SnapshotEngineAdapter::kConfigMarker = "config";
const char* const SnapshotEngineAdapter::kNoPasswordFlag = "--insecure-no-password";

namespace {

const std::regex kSnapshotSavedLine(R"(snapshot ([a-f0-9]{8}) saved)");

BackupResult failure(const std::string& message, const std::string& stdErr = std::string()) {
    BackupResult result;
    result.success = false;
    result.exitCode = -1;
    result.error = message;
    result.stdErr = stdErr.empty() ? message : stdErr;
    result.state = BackupState::HARD_FAILURE;
    return result;
}

} // namespace

SnapshotEngineAdapter::SnapshotEngineAdapter(std::shared_ptr<ProcessRunner> runner,
                                             const std::string& executablePath,
                                             ILogger* log, int timeoutMs)
    : processRunner(std::move(runner)), executable(executablePath), logger(log),
      timeoutMs(timeoutMs), parser(log) {}

EngineKind SnapshotEngineAdapter::getKind() const {
    return EngineKind::SNAPSHOT;
}

const std::string& SnapshotEngineAdapter::getExecutablePath() const {
    return executable;
}

void SnapshotEngineAdapter::setExecutablePath(const std::string& path) {
    executable = path;
}

std::string SnapshotEngineAdapter::engineRepositoryPath(const std::string& repositoryPath) {
    return (fs::path(repositoryPath) / kRepositoryDirectory).string();
}

std::vector<std::string> SnapshotEngineAdapter::buildBackupArguments(const std::string& sourcePath,
                                                                     const BackupOptions& options) {
    std::vector<std::string> args = {"backup", sourcePath, kNoPasswordFlag};
    if (!options.tag.empty()) {
        args.push_back("--tag");
        args.push_back(options.tag);
    }
    return args;
}

std::string SnapshotEngineAdapter::parseSnapshotId(const std::string& output) {
    std::smatch match;
    if (std::regex_search(output, match, kSnapshotSavedLine)) {
        return match[1].str();
    }
    return std::string();
}

ProcessResult SnapshotEngineAdapter::execute(const std::string& enginePath, const std::vector<std::string>& args) {
    ProcessOptions options;
    options.timeoutMs = timeoutMs;
    options.env["RESTIC_REPOSITORY"] = enginePath;
    return processRunner->run(executable, args, options);
}

bool SnapshotEngineAdapter::hasRepository(const std::string& repositoryPath) const {
    return FileSystem::exists((fs::path(engineRepositoryPath(repositoryPath)) / kConfigMarker).string());
}

bool SnapshotEngineAdapter::ensureRepository(const std::string& enginePath, std::string& errorMessage) {
    if (FileSystem::exists((fs::path(enginePath) / kConfigMarker).string())) {
        logger->debug("Repository already exists at: " + enginePath);
        return true;
    }

    logger->info("Creating new repository at: " + enginePath);
    if (!FileSystem::createDirectories(enginePath)) {
        errorMessage = "Failed to create repository directory: " + enginePath;
        return false;
    }

    ProcessResult result = execute(enginePath, {"init", kNoPasswordFlag});
    if (!result.success) {
        errorMessage = result.stdErr.empty() ? result.error : result.stdErr;
        return false;
    }

    logger->info("Repository initialized successfully at: " + enginePath);
    return true;
}

BackupResult SnapshotEngineAdapter::backup(const std::string& sourcePath, const std::string& repositoryPath,
                                           const BackupOptions& options) {
    if (!FileSystem::isRegularFile(sourcePath)) {
        logger->error("Backup source is not a regular file: " + sourcePath);
        return failure("Source file does not exist: " + sourcePath);
    }

    std::string enginePath = engineRepositoryPath(repositoryPath);
    std::string initError;
    if (!ensureRepository(enginePath, initError)) {
        logger->error("Failed to initialize repository: " + initError);
        return failure("Failed to initialize repository: " + stderrTail(initError), initError);
    }

    ProcessResult processResult = execute(enginePath, buildBackupArguments(sourcePath, options));
    BackupResult result = toBackupResult(processResult);
    if (!result.success) {
        logger->error("Failed to create snapshot: " + result.error);
        return result;
    }

    result.snapshotId = parseSnapshotId(processResult.stdOut);
    if (result.snapshotId.empty()) {
        logger->warn("Snapshot identifier not found in backup output");
        result.snapshotId = "unknown";
    }
    result.statistics = parser.parseSnapshotOutput(processResult.stdOut);
    logger->info("Snapshot created: " + result.snapshotId);
    return result;
}

BackupResult SnapshotEngineAdapter::backupAdjacent(const std::string& sourcePath, const std::string& repositoryPath,
                                                   const BackupOptions& options) {
    // 快照引擎直接以文件为单位，相邻与全局模式的命令相同
    return backup(sourcePath, repositoryPath, options);
}

BackupResult SnapshotEngineAdapter::restore(const std::string& repositoryPath, const std::string& selector,
                                            const std::string& targetPath, const RestoreOptions& options) {
    if (!hasRepository(repositoryPath)) {
        logger->error("No snapshot repository at " + engineRepositoryPath(repositoryPath));
        return failure("No backup repository found at " + repositoryPath);
    }

    std::string snapshot = selector.empty() ? "latest" : selector;
    std::vector<std::string> args = {"restore", snapshot, "--target", targetPath};
    if (options.force) {
        // 覆盖目标目录中已存在的文件
        args.push_back("--overwrite");
        args.push_back("always");
    }
    args.push_back(kNoPasswordFlag);
    ProcessResult processResult = execute(engineRepositoryPath(repositoryPath), args);
    BackupResult result = toBackupResult(processResult);
    if (result.success) {
        result.restoredPath = targetPath;
        result.snapshotId = snapshot;
        logger->info("Restore of snapshot " + snapshot + " completed to " + targetPath);
    }
    return result;
}

std::vector<Increment> SnapshotEngineAdapter::parseSnapshotList(const std::string& jsonOutput) const {
    std::vector<Increment> increments;
    try {
        nlohmann::json root = nlohmann::json::parse(jsonOutput);
        if (!root.is_array()) {
            logger->warn("Unexpected snapshot list format");
            return increments;
        }

        for (const auto& entry : root) {
            Increment increment;
            increment.isSnapshot = true;
            if (entry.contains("short_id")) {
                increment.identifier = entry.at("short_id").get<std::string>();
            } else if (entry.contains("id")) {
                increment.identifier = entry.at("id").get<std::string>().substr(0, 8);
            }
            increment.timestamp = entry.value("time", std::string());

            std::string description = "Snapshot " + increment.identifier;
            if (entry.contains("tags") && entry.at("tags").is_array()) {
                for (const auto& tag : entry.at("tags")) {
                    description += " [" + tag.get<std::string>() + "]";
                }
            }
            increment.description = description;
            increments.push_back(increment);
        }
    } catch (const nlohmann::json::exception& e) {
        logger->warn("Failed to parse snapshot list: " + std::string(e.what()));
        increments.clear();
    }
    return increments;
}

std::vector<Increment> SnapshotEngineAdapter::listIncrements(const std::string& repositoryPath) {
    if (!hasRepository(repositoryPath)) {
        return {};
    }

    ProcessResult result = execute(engineRepositoryPath(repositoryPath), {"snapshots", "--json", kNoPasswordFlag});
    if (!result.success) {
        logger->warn("Failed to list snapshots: " + result.stdErr);
        return {};
    }
    return parseSnapshotList(result.stdOut);
}

BackupResult SnapshotEngineAdapter::verify(const std::string& repositoryPath) {
    BackupResult result = toBackupResult(execute(engineRepositoryPath(repositoryPath), {"check", kNoPasswordFlag}));
    if (result.success) {
        logger->info("Repository check completed successfully");
    }
    return result;
}

BackupResult SnapshotEngineAdapter::info(const std::string& repositoryPath) {
    return toBackupResult(execute(engineRepositoryPath(repositoryPath), {"stats", kNoPasswordFlag}));
}

std::optional<BackupStatistics> SnapshotEngineAdapter::repositoryStatistics(const std::string& repositoryPath) {
    if (!hasRepository(repositoryPath)) {
        return std::nullopt;
    }
    ProcessResult result = execute(engineRepositoryPath(repositoryPath), {"stats", kNoPasswordFlag});
    if (!result.success) {
        logger->warn("Failed to read repository statistics: " + result.stdErr);
        return std::nullopt;
    }
    return parser.parseSnapshotRepositoryStats(result.stdOut);
}

bool SnapshotEngineAdapter::probe(const std::string& executablePath) {
    ProcessOptions options;
    options.timeoutMs = timeoutMs;
    ProcessResult result = processRunner->run(executablePath, {"version"}, options);
    bool valid = result.success && result.stdOut.find("restic") != std::string::npos;
    logger->debug("restic probe of " + executablePath + ": " + (valid ? "ok" : "failed"));
    return valid;
}
