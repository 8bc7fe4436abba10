#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "models/VersionRecord.hpp"

class ILogger;

struct VersionHistory {
    std::string assetPath;
    std::string repositoryPath;
    std::string currentVersion = "000";     // "000" 表示还没有备份
    std::vector<VersionRecord> versions;
    bool corrupted = false;                 // 记录文件存在但无法读取或解析
};

// 在引擎增量之上维护三位递增版本号，记录保存在仓库目录的 versions.json 中
class VersionMapper {
public:
    static const char* const kFileName;
    static constexpr int kMinVersion = 1;
    static constexpr int kMaxVersion = 999;

    explicit VersionMapper(ILogger* log);

    // 已有记录数 + 1，超出 [1,999] 时截断并记录警告
    std::string nextVersion(const std::string& assetPath, const std::string& repositoryPath) const;

    // 仓库或记录文件不存在时返回空历史，当前版本为 "000"
    VersionHistory history(const std::string& assetPath, const std::string& repositoryPath) const;

    // 成功备份后追加记录：清除旧的 isLatest，按版本号排序后保存
    VersionRecord recordVersion(const std::string& assetPath, const std::string& repositoryPath,
                                const std::string& version, uint64_t sourceFileSize,
                                const std::string& checksum = std::string());

    std::string formatVersionNumber(int versionNumber) const;
    int parseVersionNumber(const std::string& version) const;

    static std::string displayString(const std::string& version);

private:
    bool save(const VersionHistory& history) const;
    // 把无法解析的记录文件改名保存，返回新路径；失败返回空串
    std::string quarantineCorruptedFile(const std::string& repositoryPath) const;

    ILogger* logger;
};
