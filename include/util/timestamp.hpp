#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tw::util {

using TimePoint = std::chrono::system_clock::time_point;

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string timestampToString(const TimePoint tp) {
    return timestampToString(std::chrono::system_clock::to_time_t(tp));
}

inline std::optional<std::string> timestampToString(const std::optional<TimePoint>& tp) {
    if (!tp) return std::nullopt;
    return timestampToString(*tp);
}

inline TimePoint parseTimestampFromString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace tw::util
