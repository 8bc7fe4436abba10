#pragma once
#include "ILogger.hpp"
#include <atomic>
#include <mutex>
#include <string>

class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(LogLevel level = LogLevel::INFO);

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel level) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel level, const std::string& message) override;

private:
    std::atomic<LogLevel> minLevel;
    // 多个备份线程可能同时写日志
    std::mutex outputMutex;
};
