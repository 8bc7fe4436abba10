#include "IntegrityTracker.hpp"
#include "RenameLedger.hpp"
#include "../utils/ILogger.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/TimeUtils.hpp"

std::string toString(RelocationStep step) {
    switch (step) {
        case RelocationStep::NONE: return "none";
        case RelocationStep::ENSURE_PARENT: return "ensure-destination-parent";
        case RelocationStep::ARCHIVE_EXISTING: return "archive-existing";
        case RelocationStep::MOVE: return "move";
        case RelocationStep::VERIFY: return "verify";
        case RelocationStep::RECORD_LEDGER: return "record-ledger";
        default: return "unknown";
    }
}

IntegrityTracker::IntegrityTracker(const RepositoryLocator& locator, ILogger* log)
    : locator(locator), logger(log) {}

std::string IntegrityTracker::archiveNameFor(const std::string& repositoryPath, const std::string& isoTimestamp) {
    return fs::path(repositoryPath).filename().string() + ".pre-move-archive." +
           TimeUtils::fileNameSafeTimestamp(isoTimestamp);
}

bool IntegrityTracker::ensureDestinationParent(const std::string& newRepositoryPath, std::string& error) const {
    std::string parent = fs::path(newRepositoryPath).parent_path().string();
    if (parent.empty() || FileSystem::createDirectories(parent)) {
        return true;
    }
    error = "Failed to create destination directory: " + parent;
    return false;
}

bool IntegrityTracker::archiveIfOccupied(const std::string& newRepositoryPath, std::string& archivePath,
                                         std::string& error) const {
    archivePath.clear();
    if (!FileSystem::exists(newRepositoryPath)) {
        return true;
    }

    fs::path destination(newRepositoryPath);
    std::string timestamp = TimeUtils::currentIsoTimestamp();
    fs::path candidate = destination.parent_path() / archiveNameFor(newRepositoryPath, timestamp);
    // 同一毫秒内多次归档时追加序号，已有归档绝不覆盖
    for (int suffix = 1; FileSystem::exists(candidate.string()); ++suffix) {
        candidate = destination.parent_path() /
                    (archiveNameFor(newRepositoryPath, timestamp) + "-" + std::to_string(suffix));
    }

    logger->warn("Backup data already exists at the new location: " + newRepositoryPath + ". Archiving it.");
    std::string renameError;
    if (!FileSystem::renamePath(newRepositoryPath, candidate.string(), &renameError)) {
        error = "Failed to archive existing repository " + newRepositoryPath + ": " + renameError;
        return false;
    }
    archivePath = candidate.string();
    logger->info("Archived existing repository to " + archivePath);
    return true;
}

bool IntegrityTracker::moveRepository(const std::string& oldRepositoryPath, const std::string& newRepositoryPath,
                                      std::string& error) const {
    std::string renameError;
    if (!FileSystem::renamePath(oldRepositoryPath, newRepositoryPath, &renameError)) {
        error = "Failed to move repository " + oldRepositoryPath + " -> " + newRepositoryPath + ": " + renameError;
        return false;
    }
    return true;
}

bool IntegrityTracker::verifyRelocation(const std::string& oldRepositoryPath, const std::string& newRepositoryPath,
                                        std::string& error) const {
    if (!FileSystem::isDirectory(newRepositoryPath)) {
        error = "Repository not found at destination after move: " + newRepositoryPath;
        return false;
    }
    if (FileSystem::exists(oldRepositoryPath)) {
        error = "Repository still present at source after move: " + oldRepositoryPath;
        return false;
    }
    return true;
}

void IntegrityTracker::recordLedger(const std::string& oldLogicalPath, const std::string& newLogicalPath,
                                    RenameOutcome& outcome) const {
    // 日志跟随仓库：移动成功时在新位置，否则在仍然存在的目录中
    std::string ledgerDirectory;
    if (FileSystem::isDirectory(outcome.newRepositoryPath)) {
        ledgerDirectory = outcome.newRepositoryPath;
    } else if (FileSystem::isDirectory(outcome.oldRepositoryPath)) {
        ledgerDirectory = outcome.oldRepositoryPath;
    } else {
        ledgerDirectory = outcome.newRepositoryPath;
    }

    RenameLedger ledger(logger);
    ledger.load(ledgerDirectory);

    RenameLogEntry entry;
    entry.oldPath = oldLogicalPath;
    entry.newPath = newLogicalPath;
    entry.timestamp = TimeUtils::currentIsoTimestamp();
    ledger.append(entry);

    if (ledger.save(ledgerDirectory)) {
        outcome.ledgerRecorded = true;
    } else if (outcome.success) {
        outcome.success = false;
        outcome.failedStep = RelocationStep::RECORD_LEDGER;
        outcome.error = "Failed to record rename in " + ledgerDirectory;
    }
}

RenameOutcome IntegrityTracker::onRename(const std::string& oldPathArgument, const std::string& newPathArgument) {
    RenameOutcome outcome;
    const std::string oldLogicalPath = RenameLedger::normalizePath(oldPathArgument);
    const std::string newLogicalPath = RenameLedger::normalizePath(newPathArgument);
    if (locator.getStorageMode() != StorageMode::ADJACENT) {
        logger->debug("Rename tracking is only active for adjacent storage, skipping " + oldLogicalPath);
        return outcome;
    }

    logger->info("Handling asset rename/move: " + oldLogicalPath + " -> " + newLogicalPath);
    try {
        outcome.oldRepositoryPath = locator.resolve(oldLogicalPath);
        outcome.newRepositoryPath = locator.resolve(newLogicalPath);
    } catch (const ConfigurationError& e) {
        outcome.success = false;
        outcome.error = std::string("Configuration error: ") + e.what();
        logger->error(outcome.error);
        return outcome;
    }

    bool sameLocation = outcome.oldRepositoryPath == outcome.newRepositoryPath;
    if (!FileSystem::isDirectory(outcome.oldRepositoryPath)) {
        if (sameLocation) {
            // 从未备份且位置不变：没有可记录的内容，也不创建元数据目录
            logger->debug("No backup data and no location change for " + newLogicalPath);
            return outcome;
        }
        logger->info("No existing backup data found at " + outcome.oldRepositoryPath + ", recording rename only");
    } else if (sameLocation) {
        logger->info("Repository location unchanged: " + outcome.oldRepositoryPath);
    } else {
        std::string error;
        if (!ensureDestinationParent(outcome.newRepositoryPath, error)) {
            outcome.failedStep = RelocationStep::ENSURE_PARENT;
        } else if (!archiveIfOccupied(outcome.newRepositoryPath, outcome.archivePath, error)) {
            outcome.failedStep = RelocationStep::ARCHIVE_EXISTING;
        } else {
            outcome.archived = !outcome.archivePath.empty();
            logger->info("Moving repository: " + outcome.oldRepositoryPath + " -> " + outcome.newRepositoryPath);
            if (!moveRepository(outcome.oldRepositoryPath, outcome.newRepositoryPath, error)) {
                outcome.failedStep = RelocationStep::MOVE;
            } else if (!verifyRelocation(outcome.oldRepositoryPath, outcome.newRepositoryPath, error)) {
                outcome.failedStep = RelocationStep::VERIFY;
            } else {
                outcome.relocated = true;
            }
        }

        if (outcome.failedStep != RelocationStep::NONE) {
            // 不自动回滚，只报告失败；重命名记录仍然写入
            outcome.success = false;
            outcome.error = error;
            logger->error("Relocation failed at step " + toString(outcome.failedStep) + ": " + error);
        }
    }

    recordLedger(oldLogicalPath, newLogicalPath, outcome);
    if (outcome.success) {
        logger->info("Rename handling completed for " + newLogicalPath);
    }
    return outcome;
}

std::vector<std::string> IntegrityTracker::historicalPaths(const std::string& currentLogicalPath) const {
    if (locator.getStorageMode() != StorageMode::ADJACENT) {
        return {currentLogicalPath};
    }

    std::string repositoryPath;
    try {
        repositoryPath = locator.resolve(currentLogicalPath);
    } catch (const ConfigurationError& e) {
        logger->warn(std::string("Cannot resolve history for ") + currentLogicalPath + ": " + e.what());
        return {currentLogicalPath};
    }

    RenameLedger ledger(logger);
    ledger.load(repositoryPath);
    return ledger.historicalPaths(currentLogicalPath);
}
