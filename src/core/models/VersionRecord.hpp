#pragma once
#include <string>
#include <cstdint>

// 对外展示的三位版本号，每次成功备份一条
struct VersionRecord {
    std::string version;            // "001" - "999"
    std::string timestamp;          // ISO-8601 UTC
    std::string repositoryPath;
    uint64_t sourceFileSize = 0;
    std::string checksum;           // 备份时资产内容的 SHA-256，计算失败时为空
    bool isLatest = false;
};
