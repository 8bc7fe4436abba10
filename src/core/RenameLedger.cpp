#include "RenameLedger.hpp"
#include "../utils/ILogger.hpp"
#include "../utils/FileSystem.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

const char* const RenameLedger::kFileName = "rename-log.json";

RenameLedger::RenameLedger(ILogger* log) : logger(log) {}

bool RenameLedger::load(const std::string& metadataDirectory) {
    entries.clear();
    std::string path = (fs::path(metadataDirectory) / kFileName).string();
    if (!FileSystem::exists(path)) {
        return true;
    }

    std::string content;
    if (!FileSystem::readTextFile(path, content)) {
        if (logger) {
            logger->warn("Failed to read rename log: " + path);
        }
        return false;
    }
    if (!fromJson(content)) {
        if (logger) {
            logger->warn("Rename log is corrupted, starting with an empty log: " + path);
        }
        return false;
    }
    return true;
}

bool RenameLedger::save(const std::string& metadataDirectory) const {
    std::string path = (fs::path(metadataDirectory) / kFileName).string();
    if (!FileSystem::writeTextFile(path, toJson())) {
        if (logger) {
            logger->error("Failed to save rename log: " + path);
        }
        return false;
    }
    return true;
}

std::string RenameLedger::normalizePath(const std::string& logicalPath) {
    if (logicalPath.empty()) {
        return logicalPath;
    }
    return fs::path(logicalPath).lexically_normal().generic_string();
}

void RenameLedger::append(const RenameLogEntry& entry) {
    RenameLogEntry normalized = entry;
    normalized.oldPath = normalizePath(entry.oldPath);
    normalized.newPath = normalizePath(entry.newPath);
    entries.push_back(normalized);
    if (entries.size() > kMaxEntries) {
        entries.erase(entries.begin(), entries.begin() + (entries.size() - kMaxEntries));
    }
}

std::vector<std::string> RenameLedger::historicalPaths(const std::string& currentPath) const {
    std::string pathToCheck = normalizePath(currentPath);
    std::vector<std::string> chain = {pathToCheck};
    // 只向更早的记录查找，并限制跳数，损坏的数据也能保证终止
    size_t cursor = entries.size();
    size_t maxHops = std::min(entries.size(), kMaxEntries);

    for (size_t hop = 0; hop < maxHops; ++hop) {
        bool found = false;
        while (cursor > 0) {
            --cursor;
            const RenameLogEntry& entry = entries[cursor];
            if (entry.newPath == pathToCheck && entry.oldPath != entry.newPath) {
                chain.push_back(entry.oldPath);
                pathToCheck = entry.oldPath;
                found = true;
                break;
            }
        }
        if (!found) {
            break;
        }
    }

    std::reverse(chain.begin(), chain.end());
    return chain;
}

const std::vector<RenameLogEntry>& RenameLedger::getEntries() const {
    return entries;
}

size_t RenameLedger::size() const {
    return entries.size();
}

std::string RenameLedger::toJson() const {
    nlohmann::json root = nlohmann::json::array();
    for (const auto& entry : entries) {
        root.push_back({
            {"oldPath", entry.oldPath},
            {"newPath", entry.newPath},
            {"timestamp", entry.timestamp}
        });
    }
    return root.dump(2);
}

bool RenameLedger::fromJson(const std::string& text) {
    entries.clear();
    try {
        nlohmann::json root = nlohmann::json::parse(text);
        if (!root.is_array()) {
            return false;
        }
        for (const auto& item : root) {
            RenameLogEntry entry;
            entry.oldPath = item.at("oldPath").get<std::string>();
            entry.newPath = item.at("newPath").get<std::string>();
            entry.timestamp = item.value("timestamp", std::string());
            append(entry);
        }
    } catch (const nlohmann::json::exception& e) {
        if (logger) {
            logger->warn("Failed to parse rename log: " + std::string(e.what()));
        }
        entries.clear();
        return false;
    }
    return true;
}
