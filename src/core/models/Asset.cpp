#include "Asset.hpp"
#include "../../utils/FileSystem.hpp"
#include <sstream>
#include <system_error>

Asset::Asset() : fileSize(0), present(false) {}

Asset::Asset(const std::string& logicalPath, const fs::path& vaultRoot)
    : fileSize(0), present(false) {
    fs::path logical(logicalPath);
    if (logical.is_absolute()) {
        this->physicalPath = logical.lexically_normal();
        std::string relative = FileSystem::getRelativePath(physicalPath.string(), vaultRoot.string());
        // 库外的绝对路径保持原样作为逻辑路径
        if (relative.empty() || relative.rfind("..", 0) == 0) {
            this->logicalPath = FileSystem::toGenericPath(physicalPath.string());
        } else {
            this->logicalPath = FileSystem::toGenericPath(relative);
        }
    } else {
        this->physicalPath = (vaultRoot / logical).lexically_normal();
        this->logicalPath = FileSystem::toGenericPath(logical.lexically_normal().string());
    }
    refresh();
}

void Asset::refresh() {
    std::error_code ec;
    fs::file_status status = fs::status(physicalPath, ec);
    this->present = !ec && fs::is_regular_file(status);
    if (!present) {
        this->fileSize = 0;
        return;
    }

    this->fileSize = FileSystem::getFileSize(physicalPath.string());

    auto fileTime = fs::last_write_time(physicalPath, ec);
    if (!ec) {
        // file_time_type 与 system_clock 的纪元不同，借助两者的当前时间换算
        auto fileClockNow = fs::file_time_type::clock::now();
        auto sysClockNow = std::chrono::system_clock::now();
        this->lastModifiedTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            fileTime - fileClockNow + sysClockNow);
    }
}

const std::string& Asset::getLogicalPath() const {
    return this->logicalPath;
}

const fs::path& Asset::getPhysicalPath() const {
    return this->physicalPath;
}

std::string Asset::getFileName() const {
    return this->physicalPath.filename().string();
}

uint64_t Asset::getFileSize() const {
    return this->fileSize;
}

std::chrono::system_clock::time_point Asset::getLastModifiedTime() const {
    return this->lastModifiedTime;
}

bool Asset::exists() const {
    return this->present;
}

std::string Asset::toString() const {
    std::stringstream ss;
    ss << "Asset: " << this->logicalPath << "\n"
       << "Path: " << this->physicalPath.string() << "\n"
       << "Size: " << this->fileSize << " bytes\n"
       << "Exists: " << (this->present ? "yes" : "no");
    return ss.str();
}

bool Asset::operator==(const Asset& other) const {
    return this->physicalPath == other.physicalPath;
}

bool Asset::operator!=(const Asset& other) const {
    return !(*this == other);
}
