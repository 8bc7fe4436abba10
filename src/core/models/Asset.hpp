#pragma once
#include <string>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace fs = std::filesystem;

// 被跟踪的资产文件：逻辑路径由宿主程序维护，物理路径随重命名变化
class Asset {
private:
    std::string logicalPath;   // 相对于库根目录，统一使用正斜杠
    fs::path physicalPath;     // 绝对路径
    uint64_t fileSize;
    std::chrono::system_clock::time_point lastModifiedTime;
    bool present;

public:
    Asset();
    Asset(const std::string& logicalPath, const fs::path& vaultRoot);

    // 重新读取文件状态（大小、修改时间、是否存在）
    void refresh();

    const std::string& getLogicalPath() const;
    const fs::path& getPhysicalPath() const;
    std::string getFileName() const;
    uint64_t getFileSize() const;
    std::chrono::system_clock::time_point getLastModifiedTime() const;
    bool exists() const;

    std::string toString() const;

    bool operator==(const Asset& other) const;
    bool operator!=(const Asset& other) const;
};
