#include "TimeUtils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

std::string TimeUtils::toIsoTimestamp(std::chrono::system_clock::time_point timePoint) {
    auto time_t = std::chrono::system_clock::to_time_t(timePoint);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timePoint.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm utcTm{};
#ifdef _WIN32
    gmtime_s(&utcTm, &time_t);
#else
    gmtime_r(&time_t, &utcTm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utcTm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

std::string TimeUtils::currentIsoTimestamp() {
    return toIsoTimestamp(std::chrono::system_clock::now());
}

std::string TimeUtils::fileNameSafeTimestamp(const std::string& isoTimestamp) {
    std::string result = isoTimestamp;
    for (char& c : result) {
        if (c == ':' || c == '.') {
            c = '-';
        }
    }
    return result;
}
