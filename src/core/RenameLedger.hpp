#pragma once
#include <string>
#include <vector>
#include <cstddef>

class ILogger;

struct RenameLogEntry {
    std::string oldPath;
    std::string newPath;
    std::string timestamp;    // ISO-8601 UTC
};

// 单个资产的重命名记录，保存在其元数据目录中，只保留最近的条目
class RenameLedger {
public:
    static constexpr size_t kMaxEntries = 100;
    static const char* const kFileName;

    explicit RenameLedger(ILogger* log = nullptr);

    // 从元数据目录读取；文件不存在时为空，格式错误时记录警告并置空
    bool load(const std::string& metadataDirectory);

    // 写入元数据目录（目录不存在时会创建）
    bool save(const std::string& metadataDirectory) const;

    // 追加一条记录（路径先规范化），超过上限时丢弃最旧的
    void append(const RenameLogEntry& entry);

    // 从当前路径沿 newPath -> oldPath 回溯，返回从最旧到当前的路径链
    std::vector<std::string> historicalPaths(const std::string& currentPath) const;

    const std::vector<RenameLogEntry>& getEntries() const;
    size_t size() const;

    // "./a/../b.txt" 与 "b.txt" 视为同一逻辑路径
    static std::string normalizePath(const std::string& logicalPath);

    std::string toJson() const;
    bool fromJson(const std::string& text);

private:
    std::vector<RenameLogEntry> entries;
    ILogger* logger;
};
