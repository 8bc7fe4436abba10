#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

class FileSystem {
public:
    // 检查文件或目录是否存在
    static bool exists(const std::string& path);

    // 是否为目录 / 普通文件（不解析符号链接）
    static bool isDirectory(const std::string& path);
    static bool isRegularFile(const std::string& path);

    // 创建目录（包括父目录）
    static bool createDirectories(const std::string& path);

    // 获取文件大小，失败返回0
    static uint64_t getFileSize(const std::string& filePath);

    // 目录下所有普通文件大小之和（递归，不跟随符号链接），失败的条目忽略
    static uint64_t getDirectorySize(const std::string& directory);

    // 列出目录下的条目名称（不递归），目录不存在时返回空列表
    static std::vector<std::string> listDirectory(const std::string& directory);

    // 整体重命名文件或目录，失败时通过errorMessage返回原因
    static bool renamePath(const std::string& from, const std::string& to, std::string* errorMessage = nullptr);

    // 读取文本文件全部内容
    static bool readTextFile(const std::string& path, std::string& content);

    // 写入文本文件：先写临时文件再重命名，避免留下半截文件
    static bool writeTextFile(const std::string& path, const std::string& content);

    // 获取相对路径
    static std::string getRelativePath(const std::string& path, const std::string& base);

    // 路径转换为正斜杠形式（引擎的模式匹配要求）
    static std::string toGenericPath(const std::string& path);
};
