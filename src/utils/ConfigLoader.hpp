#pragma once
#include <string>
#include "ILogger.hpp"
#include "../core/Config.hpp"

// 从 JSON 文件读取 AppConfig；未知键忽略，格式错误抛出 ConfigurationError
class ConfigLoader {
public:
    static AppConfig loadFromFile(const std::string& path);

    // 在 base 的基础上应用 JSON 文本中出现的键
    static AppConfig loadFromString(const std::string& text, const AppConfig& base = AppConfig());

    static LogLevel parseLogLevel(const std::string& text);
};
