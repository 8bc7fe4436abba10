#include "AssetStateRegistry.hpp"
#include <algorithm>

AssetStateRegistry::Guard::Guard(AssetStateRegistry* owner, std::vector<std::string> heldKeys)
    : registry(owner), keys(std::move(heldKeys)) {}

AssetStateRegistry::Guard::~Guard() {
    release();
}

AssetStateRegistry::Guard::Guard(Guard&& other) noexcept
    : registry(other.registry), keys(std::move(other.keys)) {
    other.registry = nullptr;
    other.keys.clear();
}

AssetStateRegistry::Guard& AssetStateRegistry::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        registry = other.registry;
        keys = std::move(other.keys);
        other.registry = nullptr;
        other.keys.clear();
    }
    return *this;
}

void AssetStateRegistry::Guard::release() {
    if (registry) {
        registry->releaseKeys(keys);
        registry = nullptr;
        keys.clear();
    }
}

void AssetStateRegistry::lockKey(std::unique_lock<std::mutex>& lock, const std::string& key) {
    // std::map 的元素地址在插入其他元素后保持不变
    Entry& entry = entries[key];
    uint64_t ticket = entry.nextTicket++;
    ++entry.holders;
    turnChanged.wait(lock, [&entry, ticket]() { return entry.serving == ticket; });
}

AssetStateRegistry::Guard AssetStateRegistry::acquire(const std::string& key) {
    std::unique_lock<std::mutex> lock(mutex);
    lockKey(lock, key);
    return Guard(this, {key});
}

AssetStateRegistry::Guard AssetStateRegistry::acquire(std::vector<std::string> keys) {
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    std::unique_lock<std::mutex> lock(mutex);
    for (const auto& key : keys) {
        lockKey(lock, key);
    }
    return Guard(this, keys);
}

void AssetStateRegistry::releaseKeys(const std::vector<std::string>& keys) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& key : keys) {
            auto it = entries.find(key);
            if (it == entries.end()) {
                continue;
            }
            ++it->second.serving;
            it->second.state = BackupState::IDLE;
            // 没有等待者时移除条目，注册表不会无限增长
            if (--it->second.holders == 0) {
                entries.erase(it);
            }
        }
    }
    turnChanged.notify_all();
}

std::optional<std::chrono::system_clock::time_point> AssetStateRegistry::lastBackupTime(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = lastBackupTimes.find(key);
    if (it == lastBackupTimes.end()) {
        return std::nullopt;
    }
    return it->second;
}

void AssetStateRegistry::setLastBackupTime(const std::string& key, std::chrono::system_clock::time_point time) {
    std::lock_guard<std::mutex> lock(mutex);
    lastBackupTimes[key] = time;
}

void AssetStateRegistry::transferLastBackupTime(const std::string& fromKey, const std::string& toKey) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = lastBackupTimes.find(fromKey);
    if (it == lastBackupTimes.end() || fromKey == toKey) {
        return;
    }
    lastBackupTimes[toKey] = it->second;
    lastBackupTimes.erase(fromKey);
}

void AssetStateRegistry::setOperationState(const std::string& key, BackupState state) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(key);
    if (it != entries.end()) {
        it->second.state = state;
    }
}

BackupState AssetStateRegistry::operationState(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(key);
    return it == entries.end() ? BackupState::IDLE : it->second.state;
}

size_t AssetStateRegistry::activeEntryCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}
