#include "ConsoleLogger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

static std::string getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm localTm{};
#ifdef _WIN32
    localtime_s(&localTm, &time_t);
#else
    localtime_r(&time_t, &localTm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

ConsoleLogger::ConsoleLogger(LogLevel level) : minLevel(level) {}

void ConsoleLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void ConsoleLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void ConsoleLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void ConsoleLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void ConsoleLogger::setLogLevel(LogLevel level) {
    minLevel = level;
}

LogLevel ConsoleLogger::getLogLevel() const {
    return minLevel;
}

void ConsoleLogger::log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(minLevel.load())) {
        return;
    }

    std::lock_guard<std::mutex> lock(outputMutex);
    // 错误输出到stderr，其余输出到stdout
    std::ostream& out = (level == LogLevel::ERROR_LEVEL) ? std::cerr : std::cout;
    out << "[" << getCurrentTime() << "] [" << toString(level) << "] " << message << std::endl;
}
