#pragma once
#include <string>
#include "Types.hpp"

// 计算资产的仓库目录；纯函数，不访问文件系统，也不关心仓库是否已存在
class RepositoryLocator {
public:
    static const char* const kMetadataSuffix;

    RepositoryLocator(StorageMode mode, const std::string& vaultRoot, const std::string& globalRoot);

    // 按当前配置解析；失败时抛出 ConfigurationError
    std::string resolve(const std::string& assetPath) const;
    std::string resolve(const std::string& assetPath, StorageMode mode) const;

    // adjacent: <父目录>/<文件名>.meta
    // global:   <全局根>/<库内相对目录>/<文件名>.meta
    static std::string resolve(const std::string& assetPath, StorageMode mode,
                               const std::string& vaultRoot, const std::string& globalRoot);

    StorageMode getStorageMode() const;
    const std::string& getVaultRoot() const;
    const std::string& getGlobalRoot() const;

private:
    StorageMode storageMode;
    std::string vaultRoot;
    std::string globalRoot;
};
