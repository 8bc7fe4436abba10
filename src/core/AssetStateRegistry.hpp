#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>
#include <cstdint>
#include "Types.hpp"

// 按仓库路径维护每个资产的运行状态：操作互斥（先到先得）与上次备份时间
class AssetStateRegistry {
public:
    // 持有一个或多个资产的独占权，析构时释放
    class Guard {
    public:
        Guard() : registry(nullptr) {}
        Guard(AssetStateRegistry* owner, std::vector<std::string> heldKeys);
        ~Guard();

        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        void release();

    private:
        AssetStateRegistry* registry;
        std::vector<std::string> keys;
    };

    AssetStateRegistry() = default;
    AssetStateRegistry(const AssetStateRegistry&) = delete;
    AssetStateRegistry& operator=(const AssetStateRegistry&) = delete;

    // 阻塞直到轮到本次调用；同一资产的调用按发起顺序执行
    Guard acquire(const std::string& key);

    // 多个资产按排序后的顺序依次获取，避免死锁
    Guard acquire(std::vector<std::string> keys);

    std::optional<std::chrono::system_clock::time_point> lastBackupTime(const std::string& key) const;
    void setLastBackupTime(const std::string& key, std::chrono::system_clock::time_point time);
    void transferLastBackupTime(const std::string& fromKey, const std::string& toKey);

    // 当前持有者所处的阶段；没有操作进行时为 IDLE，释放时自动复位
    void setOperationState(const std::string& key, BackupState state);
    BackupState operationState(const std::string& key) const;

    // 当前有操作进行或等待中的资产数量
    size_t activeEntryCount() const;

private:
    struct Entry {
        uint64_t nextTicket = 0;
        uint64_t serving = 0;
        size_t holders = 0;
        BackupState state = BackupState::IDLE;
    };

    void lockKey(std::unique_lock<std::mutex>& lock, const std::string& key);
    void releaseKeys(const std::vector<std::string>& keys);

    mutable std::mutex mutex;
    std::condition_variable turnChanged;
    std::map<std::string, Entry> entries;
    std::map<std::string, std::chrono::system_clock::time_point> lastBackupTimes;
};
