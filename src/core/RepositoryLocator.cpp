#include "RepositoryLocator.hpp"
#include <filesystem>

namespace fs = std::filesystem;

const char* const RepositoryLocator::kMetadataSuffix = ".meta";

RepositoryLocator::RepositoryLocator(StorageMode mode, const std::string& vaultRoot, const std::string& globalRoot)
    : storageMode(mode), vaultRoot(vaultRoot), globalRoot(globalRoot) {}

std::string RepositoryLocator::resolve(const std::string& assetPath) const {
    return resolve(assetPath, storageMode, vaultRoot, globalRoot);
}

std::string RepositoryLocator::resolve(const std::string& assetPath, StorageMode mode) const {
    return resolve(assetPath, mode, vaultRoot, globalRoot);
}

std::string RepositoryLocator::resolve(const std::string& assetPath, StorageMode mode,
                                       const std::string& vaultRoot, const std::string& globalRoot) {
    if (assetPath.empty()) {
        throw ConfigurationError("Asset path is empty");
    }

    fs::path vault = fs::path(vaultRoot).lexically_normal();
    fs::path asset(assetPath);
    if (asset.is_relative()) {
        asset = vault / asset;
    }
    asset = asset.lexically_normal();

    if (!asset.has_filename()) {
        throw ConfigurationError("Asset path has no file name: " + assetPath);
    }
    if (!asset.is_absolute()) {
        throw ConfigurationError("Repository path for '" + assetPath + "' is not absolute (vault root: '" +
                                 vaultRoot + "')");
    }

    std::string metadataName = asset.filename().string() + kMetadataSuffix;
    fs::path repository;

    switch (mode) {
        case StorageMode::ADJACENT:
            repository = asset.parent_path() / metadataName;
            break;
        case StorageMode::GLOBAL: {
            if (globalRoot.empty()) {
                throw ConfigurationError("Global storage mode requires a global backup root");
            }
            fs::path root = fs::path(globalRoot).lexically_normal();
            if (!root.is_absolute()) {
                throw ConfigurationError("Global backup root is not absolute: " + globalRoot);
            }
            fs::path relative = asset.lexically_relative(vault);
            if (relative.empty() || *relative.begin() == "..") {
                throw ConfigurationError("Asset '" + assetPath + "' is outside the vault root '" + vaultRoot + "'");
            }
            repository = (root / relative.parent_path() / metadataName).lexically_normal();
            break;
        }
        default:
            throw ConfigurationError("Unknown storage mode: " + std::to_string(static_cast<int>(mode)));
    }

    std::string result = repository.string();
    if (result.empty()) {
        throw ConfigurationError("Resolved repository path is empty for " + assetPath);
    }
    return result;
}

StorageMode RepositoryLocator::getStorageMode() const {
    return storageMode;
}

const std::string& RepositoryLocator::getVaultRoot() const {
    return vaultRoot;
}

const std::string& RepositoryLocator::getGlobalRoot() const {
    return globalRoot;
}
