#include "FileSystem.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    // 使用symlink_status检查文件是否存在，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    // 不抛出异常，静默处理错误（如权限不足）
    return !ec && status.type() != fs::file_type::not_found;
}

bool FileSystem::isDirectory(const std::string& path) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    return !ec && status.type() == fs::file_type::directory;
}

bool FileSystem::isRegularFile(const std::string& path) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    return !ec && status.type() == fs::file_type::regular;
}

bool FileSystem::createDirectories(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    // 如果目录已存在，直接返回成功
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (!ec && (status.type() == fs::file_type::directory || status.type() == fs::file_type::symlink)) {
        return true;
    }

    fs::create_directories(path, ec);
    if (ec) {
        std::cerr << "Error: Failed to create directories for " << path << " (" << ec.message() << ")" << std::endl;
        return false;
    }
    return true;
}

uint64_t FileSystem::getFileSize(const std::string& filePath) {
    std::error_code ec;
    auto size = fs::file_size(filePath, ec);
    if (ec) {
        return 0;
    }
    return static_cast<uint64_t>(size);
}

uint64_t FileSystem::getDirectorySize(const std::string& directory) {
    uint64_t total = 0;
    if (!isDirectory(directory)) {
        return total;
    }

    std::error_code ec;
    for (fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code entryError;
        if (it->symlink_status(entryError).type() == fs::file_type::regular) {
            auto size = it->file_size(entryError);
            if (!entryError) {
                total += static_cast<uint64_t>(size);
            }
        }
    }
    return total;
}

std::vector<std::string> FileSystem::listDirectory(const std::string& directory) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!isDirectory(directory)) {
        return names;
    }

    for (fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool FileSystem::renamePath(const std::string& from, const std::string& to, std::string* errorMessage) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        if (errorMessage) {
            *errorMessage = ec.message();
        }
        return false;
    }
    return true;
}

bool FileSystem::readTextFile(const std::string& path, std::string& content) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    content = buffer.str();
    return !in.bad();
}

bool FileSystem::writeTextFile(const std::string& path, const std::string& content) {
    fs::path target(path);
    if (target.has_parent_path() && !createDirectories(target.parent_path().string())) {
        return false;
    }

    std::string tempPath = path + ".tmp";
    {
        std::ofstream out(tempPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << content;
        out.flush();
        if (!out) {
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::cerr << "Error: Failed to replace " << path << " (" << ec.message() << ")" << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

std::string FileSystem::getRelativePath(const std::string& path, const std::string& base) {
    return fs::path(path).lexically_normal().lexically_relative(fs::path(base).lexically_normal()).string();
}

std::string FileSystem::toGenericPath(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}
