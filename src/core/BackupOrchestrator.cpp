#include "BackupOrchestrator.hpp"
#include "../utils/ILogger.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/Checksum.hpp"
#include <algorithm>
#include <chrono>

const char* const BackupOrchestrator::kRestoredSuffix = ".restored";

namespace {

BackupResult failedResult(const std::string& message) {
    BackupResult result;
    result.success = false;
    result.exitCode = -1;
    result.error = message;
    result.state = BackupState::HARD_FAILURE;
    return result;
}

} // namespace

BackupOrchestrator::BackupOrchestrator(const AppConfig& config, std::unique_ptr<EngineAdapter> engine, ILogger* log)
    : config(config),
      logger(log),
      locator(config.storageMode, config.vaultRoot, config.globalBackupRoot),
      engine(std::move(engine)),
      integrityTracker(locator, log),
      versionMapper(log),
      engineAvailable(false) {}

const AppConfig& BackupOrchestrator::getConfig() const {
    return config;
}

EngineAdapter& BackupOrchestrator::getEngine() {
    return *engine;
}

AssetStateRegistry& BackupOrchestrator::getStateRegistry() {
    return stateRegistry;
}

std::string BackupOrchestrator::repositoryPathFor(const Asset& asset) const {
    return locator.resolve(asset.getPhysicalPath().string());
}

bool BackupOrchestrator::isAvailable() {
    if (engineAvailable) {
        return true;
    }

    std::lock_guard<std::mutex> lock(availabilityMutex);
    if (engineAvailable) {
        return true;
    }

    bool available = engine->isAvailable();
    if (!available) {
        std::vector<std::string> candidates;
        if (!config.enginePath.empty()) {
            candidates.push_back(config.enginePath);
        }
        candidates.push_back(defaultExecutableName(engine->getKind()));
        available = engine->detectExecutable(candidates);
    }

    if (available) {
        logger->info(toString(engine->getKind()) + " engine available at " + engine->getExecutablePath());
    } else {
        logger->warn("No working " + toString(engine->getKind()) + " engine executable found");
    }
    engineAvailable = available;
    return available;
}

BackupOptions BackupOrchestrator::effectiveOptions(const Asset& asset, const BackupOptions& requested) const {
    BackupOptions options = requested;
    if (!options.compression.has_value()) {
        options.compression = asset.getFileSize() > config.compressionThresholdBytes;
    }

    std::vector<std::string> includes = config.includePatterns;
    includes.insert(includes.end(), requested.includePatterns.begin(), requested.includePatterns.end());
    options.includePatterns = includes;

    std::vector<std::string> excludes = config.excludePatterns;
    excludes.insert(excludes.end(), requested.excludePatterns.begin(), requested.excludePatterns.end());
    options.excludePatterns = excludes;
    return options;
}

BackupResult BackupOrchestrator::backup(const Asset& asset, const BackupRequest& request) {
    try {
        return runBackup(asset, request);
    } catch (const ConfigurationError& e) {
        logger->error(std::string("Configuration error: ") + e.what());
        return failedResult(std::string("Configuration error: ") + e.what());
    } catch (const std::exception& e) {
        logger->error("Exception during backup of " + asset.getLogicalPath() + ": " + e.what());
        return failedResult(std::string("Backup failed: ") + e.what());
    }
}

BackupResult BackupOrchestrator::runBackup(const Asset& asset, const BackupRequest& request) {
    Asset current = asset;
    current.refresh();
    if (!current.exists()) {
        logger->error("Source file does not exist: " + current.getPhysicalPath().string());
        return failedResult("Source file does not exist: " + current.getPhysicalPath().string());
    }

    std::string repositoryPath = repositoryPathFor(current);
    AssetStateRegistry::Guard guard = stateRegistry.acquire(repositoryPath);

    if (request.automatic && config.preventDuplicateBackups) {
        auto last = stateRegistry.lastBackupTime(repositoryPath);
        if (last) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now() - *last).count();
            if (elapsed < config.minBackupIntervalSeconds) {
                BackupResult skipped;
                skipped.skipped = true;
                skipped.state = BackupState::IDLE;
                skipped.error = "Backup skipped: last backup was " + std::to_string(elapsed) +
                                "s ago (minimum interval " + std::to_string(config.minBackupIntervalSeconds) + "s)";
                logger->debug(skipped.error + " for " + current.getLogicalPath());
                return skipped;
            }
        }
    }

    if (!isAvailable()) {
        return failedResult("Backup engine '" + engine->getExecutablePath() + "' is not available");
    }

    std::string parentDirectory = fs::path(repositoryPath).parent_path().string();
    if (!FileSystem::createDirectories(parentDirectory)) {
        return failedResult("Failed to create repository parent directory: " + parentDirectory);
    }

    stateRegistry.setOperationState(repositoryPath, BackupState::COMMAND_BUILDING);
    // 先预留版本号；失败时不记录，也不会被重复使用
    std::string version = versionMapper.nextVersion(current.getLogicalPath(), repositoryPath);
    BackupOptions options = effectiveOptions(current, request.options);

    logger->info("Starting backup of " + current.getLogicalPath() + " (version " + version + ") to " + repositoryPath);
    stateRegistry.setOperationState(repositoryPath, BackupState::EXECUTING);
    BackupResult result = config.storageMode == StorageMode::ADJACENT
        ? engine->backupAdjacent(current.getPhysicalPath().string(), repositoryPath, options)
        : engine->backup(current.getPhysicalPath().string(), repositoryPath, options);

    if (!result.success) {
        result.state = BackupState::HARD_FAILURE;
    }
    stateRegistry.setOperationState(repositoryPath, result.state);
    if (!result.success) {
        logger->error("Backup of " + current.getLogicalPath() + " failed: " + result.error);
        return result;
    }

    std::string checksum;
    if (!Checksum::sha256File(current.getPhysicalPath().string(), checksum)) {
        logger->warn("Failed to compute checksum of " + current.getPhysicalPath().string());
    }
    result.versionInfo = versionMapper.recordVersion(current.getLogicalPath(), repositoryPath, version,
                                                     current.getFileSize(), checksum);
    stateRegistry.setLastBackupTime(repositoryPath, std::chrono::system_clock::now());
    logger->info("Backup of " + current.getLogicalPath() + " completed as " + VersionMapper::displayString(version) +
                 " (" + toString(result.state) + ")");
    return result;
}

BackupResult BackupOrchestrator::restore(const Asset& asset, const std::string& selector, bool force) {
    try {
        return runRestore(asset, selector, force);
    } catch (const ConfigurationError& e) {
        logger->error(std::string("Configuration error: ") + e.what());
        return failedResult(std::string("Configuration error: ") + e.what());
    } catch (const std::exception& e) {
        logger->error("Exception during restore of " + asset.getLogicalPath() + ": " + e.what());
        return failedResult(std::string("Restore failed: ") + e.what());
    }
}

BackupResult BackupOrchestrator::runRestore(const Asset& asset, const std::string& selector, bool force) {
    std::string repositoryPath = repositoryPathFor(asset);
    AssetStateRegistry::Guard guard = stateRegistry.acquire(repositoryPath);

    if (!isAvailable()) {
        return failedResult("Backup engine '" + engine->getExecutablePath() + "' is not available");
    }
    if (!engine->hasRepository(repositoryPath)) {
        return failedResult("No backup found for " + asset.getLogicalPath());
    }

    RestoreOptions options;
    options.force = force;
    options.assetFileName = asset.getFileName();
    std::string target = asset.getPhysicalPath().string() + kRestoredSuffix;
    std::string effectiveSelector = selector.empty() ? "latest" : selector;

    logger->info("Restoring " + asset.getLogicalPath() + " at " + effectiveSelector + " to " + target);
    stateRegistry.setOperationState(repositoryPath, BackupState::EXECUTING);
    BackupResult result = engine->restore(repositoryPath, effectiveSelector, target, options);
    if (!result.success) {
        result.state = BackupState::HARD_FAILURE;
        logger->error("Restore of " + asset.getLogicalPath() + " failed: " + result.error);
    }
    return result;
}

AssetHistory BackupOrchestrator::history(const Asset& asset) {
    AssetHistory result;
    try {
        result.repositoryPath = repositoryPathFor(asset);
        AssetStateRegistry::Guard guard = stateRegistry.acquire(result.repositoryPath);

        VersionHistory versions = versionMapper.history(asset.getLogicalPath(), result.repositoryPath);
        result.versions = versions.versions;
        result.currentVersion = versions.currentVersion;

        result.hasBackup = engine->hasRepository(result.repositoryPath);
        if (result.hasBackup && isAvailable()) {
            result.statistics = engine->repositoryStatistics(result.repositoryPath);
            result.increments = engine->listIncrements(result.repositoryPath);
        }
    } catch (const ConfigurationError& e) {
        logger->error(std::string("Configuration error: ") + e.what());
    } catch (const std::exception& e) {
        logger->error("Exception while reading history of " + asset.getLogicalPath() + ": " + e.what());
    }
    return result;
}

BackupResult BackupOrchestrator::verify(const Asset& asset) {
    try {
        return runVerify(asset);
    } catch (const ConfigurationError& e) {
        logger->error(std::string("Configuration error: ") + e.what());
        return failedResult(std::string("Configuration error: ") + e.what());
    } catch (const std::exception& e) {
        logger->error("Exception during verification of " + asset.getLogicalPath() + ": " + e.what());
        return failedResult(std::string("Verification failed: ") + e.what());
    }
}

BackupResult BackupOrchestrator::runVerify(const Asset& asset) {
    std::string repositoryPath = repositoryPathFor(asset);
    AssetStateRegistry::Guard guard = stateRegistry.acquire(repositoryPath);

    if (!isAvailable()) {
        return failedResult("Backup engine '" + engine->getExecutablePath() + "' is not available");
    }
    if (!engine->hasRepository(repositoryPath)) {
        return failedResult("No backup found for " + asset.getLogicalPath());
    }
    return engine->verify(repositoryPath);
}

RenameOutcome BackupOrchestrator::onAssetRenamed(const std::string& oldLogicalPath, const std::string& newLogicalPath) {
    std::vector<std::string> keys;
    std::string oldKey;
    std::string newKey;
    try {
        oldKey = locator.resolve(oldLogicalPath);
        newKey = locator.resolve(newLogicalPath);
        keys = {oldKey, newKey};
    } catch (const ConfigurationError& e) {
        RenameOutcome outcome;
        outcome.success = false;
        outcome.error = std::string("Configuration error: ") + e.what();
        logger->error(outcome.error);
        return outcome;
    }

    AssetStateRegistry::Guard guard = stateRegistry.acquire(keys);
    RenameOutcome outcome = integrityTracker.onRename(oldLogicalPath, newLogicalPath);
    stateRegistry.transferLastBackupTime(oldKey, newKey);
    return outcome;
}

std::vector<std::string> BackupOrchestrator::historicalPaths(const Asset& asset) const {
    return integrityTracker.historicalPaths(asset.getLogicalPath());
}

std::vector<BackedUpAsset> BackupOrchestrator::listBackedUpAssets() {
    try {
        return scanRepositories();
    } catch (const std::exception& e) {
        logger->error(std::string("Failed to list backed up assets: ") + e.what());
        return std::vector<BackedUpAsset>();
    }
}

std::vector<BackedUpAsset> BackupOrchestrator::scanRepositories() {
    std::vector<BackedUpAsset> assets;
    std::string root = config.storageMode == StorageMode::ADJACENT ? config.vaultRoot : config.globalBackupRoot;
    if (root.empty() || !FileSystem::isDirectory(root)) {
        logger->warn("Repository root does not exist: " + root);
        return assets;
    }

    const std::string suffix = RepositoryLocator::kMetadataSuffix;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code entryError;
        if (it->symlink_status(entryError).type() != fs::file_type::directory) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        // 元数据目录内部不会再有资产
        it.disable_recursion_pending();

        std::string repositoryPath = it->path().lexically_normal().string();
        if (!engine->hasRepository(repositoryPath)) {
            continue;
        }

        BackedUpAsset asset;
        fs::path assetPath = it->path().parent_path() / name.substr(0, name.size() - suffix.size());
        asset.logicalPath = assetPath.lexically_relative(root).generic_string();
        asset.repositoryPath = repositoryPath;
        {
            AssetStateRegistry::Guard guard = stateRegistry.acquire(repositoryPath);
            VersionHistory versions = versionMapper.history(asset.logicalPath, repositoryPath);
            asset.currentVersion = versions.currentVersion;
            asset.versionCount = versions.versions.size();
            asset.repositorySizeBytes = FileSystem::getDirectorySize(repositoryPath);
        }
        assets.push_back(asset);
    }
    if (ec) {
        logger->warn("Repository scan of " + root + " stopped early: " + ec.message());
    }

    std::sort(assets.begin(), assets.end(), [](const BackedUpAsset& a, const BackedUpAsset& b) {
        return a.logicalPath < b.logicalPath;
    });
    logger->debug("Found " + std::to_string(assets.size()) + " backed up assets under " + root);
    return assets;
}

RepositorySummary BackupOrchestrator::repositorySummary() {
    RepositorySummary summary;
    std::vector<BackedUpAsset> assets = listBackedUpAssets();
    bool engineReady = !assets.empty() && isAvailable();

    double savingsTotal = 0;
    size_t savingsCount = 0;
    for (const auto& asset : assets) {
        summary.repositoryCount++;
        summary.totalSizeBytes += asset.repositorySizeBytes;
        if (!engineReady) {
            continue;
        }

        std::optional<BackupStatistics> stats;
        {
            AssetStateRegistry::Guard guard = stateRegistry.acquire(asset.repositoryPath);
            stats = engine->repositoryStatistics(asset.repositoryPath);
        }
        if (stats && stats->spaceSavingsPercent) {
            savingsTotal += *stats->spaceSavingsPercent;
            savingsCount++;
        }
    }

    if (savingsCount > 0) {
        summary.averageSpaceSavingsPercent = savingsTotal / static_cast<double>(savingsCount);
    }
    return summary;
}
