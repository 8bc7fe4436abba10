#include "ConfigLoader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace {

template <typename T>
void readIfPresent(const nlohmann::json& root, const char* key, T& target) {
    if (root.contains(key) && !root.at(key).is_null()) {
        target = root.at(key).get<T>();
    }
}

} // namespace

LogLevel ConfigLoader::parseLogLevel(const std::string& text) {
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warn" || text == "warning") return LogLevel::WARNING;
    if (text == "error") return LogLevel::ERROR_LEVEL;
    throw ConfigurationError("Unknown log level: '" + text + "'");
}

AppConfig ConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open config file: " + path);
    }

    nlohmann::json root;
    try {
        file >> root;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Invalid JSON in " + path + ": " + e.what());
    }
    return loadFromString(root.dump());
}

AppConfig ConfigLoader::loadFromString(const std::string& text, const AppConfig& base) {
    AppConfig config = base;
    try {
        nlohmann::json root = nlohmann::json::parse(text);
        if (!root.is_object()) {
            throw ConfigurationError("Config root must be a JSON object");
        }

        if (root.contains("engineKind")) {
            config.engineKind = parseEngineKind(root.at("engineKind").get<std::string>());
        }
        if (root.contains("storageMode")) {
            config.storageMode = parseStorageMode(root.at("storageMode").get<std::string>());
        }
        if (root.contains("logLevel")) {
            config.logLevel = parseLogLevel(root.at("logLevel").get<std::string>());
        }
        readIfPresent(root, "enginePath", config.enginePath);
        readIfPresent(root, "vaultRoot", config.vaultRoot);
        readIfPresent(root, "globalBackupRoot", config.globalBackupRoot);
        readIfPresent(root, "compressionThresholdBytes", config.compressionThresholdBytes);
        readIfPresent(root, "includePatterns", config.includePatterns);
        readIfPresent(root, "excludePatterns", config.excludePatterns);
        readIfPresent(root, "backupFileExtensions", config.backupFileExtensions);
        readIfPresent(root, "preventDuplicateBackups", config.preventDuplicateBackups);
        readIfPresent(root, "minBackupIntervalSeconds", config.minBackupIntervalSeconds);
        readIfPresent(root, "autoBackupDelayMs", config.autoBackupDelayMs);
        readIfPresent(root, "processTimeoutMs", config.processTimeoutMs);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
    }

    if (config.minBackupIntervalSeconds < 0 || config.autoBackupDelayMs < 0 || config.processTimeoutMs < 0) {
        throw ConfigurationError("Intervals and timeouts must not be negative");
    }
    return config;
}
