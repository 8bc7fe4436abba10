#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <condition_variable>
#include "models/Asset.hpp"
#include "models/BackupResult.hpp"

class ILogger;
class AssetFilter;
class BackupOrchestrator;

// 保存后自动备份：每次修改通知重新计时，防抖时间到期后由工作线程发起自动备份
class AutoBackupScheduler {
public:
    using CompletionCallback = std::function<void(const Asset&, const BackupResult&)>;

    AutoBackupScheduler(BackupOrchestrator& orchestrator, ILogger* log, int debounceTimeMs,
                        std::vector<std::shared_ptr<AssetFilter>> filters = {});
    ~AutoBackupScheduler();

    AutoBackupScheduler(const AutoBackupScheduler&) = delete;
    AutoBackupScheduler& operator=(const AutoBackupScheduler&) = delete;

    bool start();

    // 等待工作线程结束，丢弃尚未到期的备份
    void stop();

    bool isRunning() const;

    // 资产被修改；不满足过滤条件时返回 false
    bool notifyModified(const Asset& asset);

    // 取消尚未执行的备份（资产被删除或重命名时）
    bool cancel(const std::string& logicalPath);

    size_t pendingCount() const;

    void setCompletionCallback(CompletionCallback callback);

private:
    struct PendingBackup {
        Asset asset;
        std::chrono::steady_clock::time_point due;
    };

    void workerThreadFunc();
    bool accepts(const Asset& asset) const;

    BackupOrchestrator& orchestrator;
    ILogger* logger;
    std::chrono::milliseconds debounceTime;
    std::vector<std::shared_ptr<AssetFilter>> filters;
    CompletionCallback onCompleted;

    std::map<std::string, PendingBackup> pending;
    mutable std::mutex queueMutex;
    std::condition_variable queueCV;

    std::thread workerThread;
    std::atomic<bool> running;
};
