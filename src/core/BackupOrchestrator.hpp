#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include "Config.hpp"
#include "RepositoryLocator.hpp"
#include "IntegrityTracker.hpp"
#include "VersionMapper.hpp"
#include "AssetStateRegistry.hpp"
#include "engines/EngineAdapter.hpp"
#include "models/Asset.hpp"
#include "models/BackupResult.hpp"

class ILogger;

struct BackupRequest {
    BackupOptions options;
    bool automatic = false;      // 由宿主自动触发，受备份间隔下限约束
};

// 单个资产的备份/恢复/历史查询入口；同一资产的操作串行执行，所有公开操作都不抛异常
class BackupOrchestrator {
public:
    static const char* const kRestoredSuffix;

    BackupOrchestrator(const AppConfig& config, std::unique_ptr<EngineAdapter> engine, ILogger* log);

    BackupOrchestrator(const BackupOrchestrator&) = delete;
    BackupOrchestrator& operator=(const BackupOrchestrator&) = delete;

    BackupResult backup(const Asset& asset, const BackupRequest& request = BackupRequest());

    // selector 默认为 "latest"；恢复到 <资产路径>.restored，不覆盖资产本身
    BackupResult restore(const Asset& asset, const std::string& selector = "latest", bool force = false);

    AssetHistory history(const Asset& asset);

    BackupResult verify(const Asset& asset);

    // 引擎可用后结果被缓存；不可用时尝试在候选路径中探测
    bool isAvailable();

    // 逻辑路径相对于库根目录
    RenameOutcome onAssetRenamed(const std::string& oldLogicalPath, const std::string& newLogicalPath);

    std::vector<std::string> historicalPaths(const Asset& asset) const;

    // 扫描库目录（相邻模式）或全局根目录，列出引擎仓库存在的资产，按逻辑路径排序
    std::vector<BackedUpAsset> listBackedUpAssets();

    // 仓库数量、总占用与平均空间节省率
    RepositorySummary repositorySummary();

    // 解析失败时抛出 ConfigurationError
    std::string repositoryPathFor(const Asset& asset) const;

    const AppConfig& getConfig() const;
    EngineAdapter& getEngine();
    AssetStateRegistry& getStateRegistry();

private:
    BackupResult runBackup(const Asset& asset, const BackupRequest& request);
    BackupResult runRestore(const Asset& asset, const std::string& selector, bool force);
    BackupResult runVerify(const Asset& asset);
    std::vector<BackedUpAsset> scanRepositories();
    BackupOptions effectiveOptions(const Asset& asset, const BackupOptions& requested) const;

    AppConfig config;
    ILogger* logger;
    RepositoryLocator locator;
    std::unique_ptr<EngineAdapter> engine;
    IntegrityTracker integrityTracker;
    VersionMapper versionMapper;
    AssetStateRegistry stateRegistry;

    std::atomic<bool> engineAvailable;
    std::mutex availabilityMutex;
};
