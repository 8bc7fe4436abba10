#include "AutoBackupScheduler.hpp"
#include "BackupOrchestrator.hpp"
#include "Filter.hpp"
#include "../utils/ILogger.hpp"
#include <algorithm>

AutoBackupScheduler::AutoBackupScheduler(BackupOrchestrator& orchestrator, ILogger* log, int debounceTimeMs,
                                         std::vector<std::shared_ptr<AssetFilter>> filters)
    : orchestrator(orchestrator), logger(log), debounceTime(debounceTimeMs),
      filters(std::move(filters)), running(false) {}

AutoBackupScheduler::~AutoBackupScheduler() {
    stop();
}

bool AutoBackupScheduler::start() {
    if (running) {
        return true;
    }
    running = true;
    workerThread = std::thread(&AutoBackupScheduler::workerThreadFunc, this);
    logger->info("Auto backup scheduler started (delay " + std::to_string(debounceTime.count()) + " ms)");
    return true;
}

void AutoBackupScheduler::stop() {
    if (!running) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex);
        running = false;
        pending.clear();
    }
    queueCV.notify_all();

    if (workerThread.joinable()) {
        workerThread.join();
    }
    logger->info("Auto backup scheduler stopped");
}

bool AutoBackupScheduler::isRunning() const {
    return running;
}

void AutoBackupScheduler::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(queueMutex);
    onCompleted = std::move(callback);
}

bool AutoBackupScheduler::accepts(const Asset& asset) const {
    for (const auto& filter : filters) {
        if (filter && !filter->match(asset)) {
            return false;
        }
    }
    return true;
}

bool AutoBackupScheduler::notifyModified(const Asset& asset) {
    if (!accepts(asset)) {
        logger->debug("Asset not eligible for auto backup: " + asset.getLogicalPath());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex);
        // 再次修改时重新计时
        pending[asset.getLogicalPath()] = PendingBackup{asset, std::chrono::steady_clock::now() + debounceTime};
    }
    queueCV.notify_one();
    logger->debug("Auto backup scheduled for " + asset.getLogicalPath());
    return true;
}

bool AutoBackupScheduler::cancel(const std::string& logicalPath) {
    std::lock_guard<std::mutex> lock(queueMutex);
    return pending.erase(logicalPath) > 0;
}

size_t AutoBackupScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return pending.size();
}

void AutoBackupScheduler::workerThreadFunc() {
    std::unique_lock<std::mutex> lock(queueMutex);
    while (running) {
        if (pending.empty()) {
            queueCV.wait(lock, [this]() { return !running || !pending.empty(); });
            continue;
        }

        auto nextDue = pending.begin()->second.due;
        for (const auto& item : pending) {
            nextDue = std::min(nextDue, item.second.due);
        }
        if (std::chrono::steady_clock::now() < nextDue) {
            queueCV.wait_until(lock, nextDue);
            continue;
        }

        // 取出所有到期的资产，在锁外执行备份
        std::vector<Asset> due;
        auto now = std::chrono::steady_clock::now();
        for (auto it = pending.begin(); it != pending.end();) {
            if (it->second.due <= now) {
                due.push_back(it->second.asset);
                it = pending.erase(it);
            } else {
                ++it;
            }
        }
        CompletionCallback callback = onCompleted;
        lock.unlock();

        for (const auto& asset : due) {
            BackupRequest request;
            request.automatic = true;
            BackupResult result = orchestrator.backup(asset, request);
            if (result.skipped) {
                logger->debug("Auto backup skipped for " + asset.getLogicalPath());
            } else if (result.success) {
                logger->info("Auto backup completed for " + asset.getLogicalPath());
            } else {
                logger->error("Auto backup failed for " + asset.getLogicalPath() + ": " + result.error);
            }
            if (callback) {
                callback(asset, result);
            }
        }

        lock.lock();
    }
}
