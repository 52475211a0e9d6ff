#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace dw::util {

inline std::time_t now() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

std::string timestampToString(std::time_t ts);                // ISO 8601 UTC, "2024-05-01T10:00:00Z"
std::string timestampToDisplay(std::time_t ts);               // local time, "2024-05-01 10:00:00"
std::string timestampToSuffix(std::time_t ts);                // local time, "20240501_100000"
std::string compactTimestamp(std::time_t ts);                 // local time, "20240501100000"

// Accepts "YYYY-MM-DD[T ]HH:MM:SS[.frac][Z|+hh:mm|-hh:mm|+hhmm]".
// Values without zone designator are read as local time.
std::optional<std::time_t> parseIso8601(const std::string& iso);

std::optional<std::time_t> fileModifiedTime(const std::string& path);

} // namespace dw::util
