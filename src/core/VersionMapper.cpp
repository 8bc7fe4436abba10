#include "VersionMapper.hpp"
#include "../utils/ILogger.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/TimeUtils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

const char* const VersionMapper::kFileName = "versions.json";

VersionMapper::VersionMapper(ILogger* log) : logger(log) {}

std::string VersionMapper::formatVersionNumber(int versionNumber) const {
    if (versionNumber < kMinVersion || versionNumber > kMaxVersion) {
        logger->warn("Version number " + std::to_string(versionNumber) + " is out of range (" +
                     std::to_string(kMinVersion) + "-" + std::to_string(kMaxVersion) + "), clamping");
        versionNumber = std::max(kMinVersion, std::min(kMaxVersion, versionNumber));
    }
    std::ostringstream oss;
    oss << std::setw(3) << std::setfill('0') << versionNumber;
    return oss.str();
}

int VersionMapper::parseVersionNumber(const std::string& version) const {
    char* end = nullptr;
    long parsed = std::strtol(version.c_str(), &end, 10);
    if (version.empty() || end == version.c_str()) {
        logger->warn("Invalid version string: " + version + ", defaulting to 1");
        return 1;
    }
    return static_cast<int>(parsed);
}

std::string VersionMapper::displayString(const std::string& version) {
    return "v" + version;
}

VersionHistory VersionMapper::history(const std::string& assetPath, const std::string& repositoryPath) const {
    VersionHistory result;
    result.assetPath = assetPath;
    result.repositoryPath = repositoryPath;

    std::string path = (fs::path(repositoryPath) / kFileName).string();
    if (!FileSystem::exists(path)) {
        return result;
    }

    std::string content;
    if (!FileSystem::readTextFile(path, content)) {
        logger->warn("Failed to read version history: " + path);
        result.corrupted = true;
        return result;
    }

    try {
        nlohmann::json root = nlohmann::json::parse(content);
        for (const auto& item : root.at("records")) {
            VersionRecord record;
            record.version = item.at("version").get<std::string>();
            record.timestamp = item.value("timestamp", std::string());
            record.repositoryPath = item.value("repositoryPath", repositoryPath);
            record.sourceFileSize = item.value("sourceFileSize", static_cast<uint64_t>(0));
            record.checksum = item.value("checksum", std::string());
            record.isLatest = item.value("isLatest", false);
            result.versions.push_back(record);
        }
    } catch (const nlohmann::json::exception& e) {
        logger->warn("Version history is corrupted (" + std::string(e.what()) + "): " + path);
        result.versions.clear();
        result.corrupted = true;
        return result;
    }

    std::stable_sort(result.versions.begin(), result.versions.end(),
                     [this](const VersionRecord& a, const VersionRecord& b) {
                         return parseVersionNumber(a.version) < parseVersionNumber(b.version);
                     });
    if (!result.versions.empty()) {
        result.currentVersion = result.versions.back().version;
    }
    return result;
}

std::string VersionMapper::nextVersion(const std::string& assetPath, const std::string& repositoryPath) const {
    VersionHistory existing = history(assetPath, repositoryPath);
    std::string next = formatVersionNumber(static_cast<int>(existing.versions.size()) + 1);
    logger->debug("Next version for " + assetPath + ": " + next);
    return next;
}

VersionRecord VersionMapper::recordVersion(const std::string& assetPath, const std::string& repositoryPath,
                                           const std::string& version, uint64_t sourceFileSize,
                                           const std::string& checksum) {
    VersionHistory current = history(assetPath, repositoryPath);
    current.assetPath = assetPath;

    for (auto& record : current.versions) {
        record.isLatest = false;
    }

    VersionRecord record;
    record.version = version;
    record.timestamp = TimeUtils::currentIsoTimestamp();
    record.repositoryPath = repositoryPath;
    record.sourceFileSize = sourceFileSize;
    record.checksum = checksum;
    record.isLatest = true;
    current.versions.push_back(record);

    std::stable_sort(current.versions.begin(), current.versions.end(),
                     [this](const VersionRecord& a, const VersionRecord& b) {
                         return parseVersionNumber(a.version) < parseVersionNumber(b.version);
                     });
    current.currentVersion = version;

    if (current.corrupted && quarantineCorruptedFile(repositoryPath).empty()) {
        // 旧记录无法移走时不覆盖，宁可丢失本次记录
        logger->error("Refusing to overwrite unreadable version history for " + assetPath);
        return record;
    }

    if (!save(current)) {
        logger->error("Failed to persist version " + version + " for " + assetPath);
    } else {
        logger->info("Recorded version " + displayString(version) + " for " + assetPath);
    }
    return record;
}

std::string VersionMapper::quarantineCorruptedFile(const std::string& repositoryPath) const {
    std::string path = (fs::path(repositoryPath) / kFileName).string();
    std::string target = path + ".corrupt-" + TimeUtils::fileNameSafeTimestamp(TimeUtils::currentIsoTimestamp());
    std::string error;
    if (!FileSystem::renamePath(path, target, &error)) {
        logger->error("Failed to set aside corrupted version history " + path + ": " + error);
        return std::string();
    }
    logger->warn("Corrupted version history moved to " + target);
    return target;
}

bool VersionMapper::save(const VersionHistory& history) const {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& record : history.versions) {
        records.push_back({
            {"version", record.version},
            {"timestamp", record.timestamp},
            {"repositoryPath", record.repositoryPath},
            {"sourceFileSize", record.sourceFileSize},
            {"checksum", record.checksum},
            {"isLatest", record.isLatest}
        });
    }
    nlohmann::json root = {
        {"assetPath", history.assetPath},
        {"records", records}
    };
    return FileSystem::writeTextFile((fs::path(history.repositoryPath) / kFileName).string(), root.dump(2));
}
