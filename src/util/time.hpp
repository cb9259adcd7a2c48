#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace royaos::util {

// ISO 8601 with millisecond precision, UTC
inline std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

inline uint64_t unix_millis(std::chrono::system_clock::time_point tp) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count());
}

inline uint64_t now_millis() {
    return unix_millis(std::chrono::system_clock::now());
}

} // namespace royaos::util
