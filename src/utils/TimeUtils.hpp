#pragma once
#include <chrono>
#include <string>

class TimeUtils {
public:
    // ISO-8601 UTC时间，精确到毫秒，例如 2025-06-13T02:25:58.123Z
    static std::string toIsoTimestamp(std::chrono::system_clock::time_point timePoint);

    static std::string currentIsoTimestamp();

    // 可用于文件名的时间戳：把 ':' 和 '.' 替换为 '-'
    static std::string fileNameSafeTimestamp(const std::string& isoTimestamp);
};
