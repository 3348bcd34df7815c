#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace sn::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string getCurrentTimestamp() {
    return timestampToString(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

// Compact UTC stamp for file names, e.g. 20260209_153045
inline std::string getFileStamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    const std::tm tm = *gmtime(&now_c);
    char buffer[16];
    strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);
    return {buffer};
}

} // namespace sn::util
