#include "util/timestamp.hpp"

#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace dw::util {

namespace {

std::tm toLocal(const std::time_t ts) {
    std::tm tm{};
    localtime_r(&ts, &tm);
    return tm;
}

std::string format(const std::tm& tm, const char* fmt) {
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

bool readDigits(const std::string& s, size_t& pos, const size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        const auto c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c)) return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

bool expect(const std::string& s, size_t& pos, const char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

}

std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    return format(tm, "%Y-%m-%dT%H:%M:%SZ");
}

std::string timestampToDisplay(const std::time_t ts) { return format(toLocal(ts), "%Y-%m-%d %H:%M:%S"); }

std::string timestampToSuffix(const std::time_t ts) { return format(toLocal(ts), "%Y%m%d_%H%M%S"); }

std::string compactTimestamp(const std::time_t ts) { return format(toLocal(ts), "%Y%m%d%H%M%S"); }

std::optional<std::time_t> parseIso8601(const std::string& iso) {
    std::tm tm{};
    size_t pos = 0;
    int year, month, day, hour, minute, second;

    if (!readDigits(iso, pos, 4, year) || !expect(iso, pos, '-') ||
        !readDigits(iso, pos, 2, month) || !expect(iso, pos, '-') ||
        !readDigits(iso, pos, 2, day)) return std::nullopt;

    if (pos >= iso.size() || (iso[pos] != 'T' && iso[pos] != ' ')) return std::nullopt;
    ++pos;

    if (!readDigits(iso, pos, 2, hour) || !expect(iso, pos, ':') ||
        !readDigits(iso, pos, 2, minute) || !expect(iso, pos, ':') ||
        !readDigits(iso, pos, 2, second)) return std::nullopt;

    // fractional seconds are dropped, comparisons run at second precision
    if (pos < iso.size() && iso[pos] == '.') {
        ++pos;
        while (pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos]))) ++pos;
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    if (pos == iso.size()) {
        tm.tm_isdst = -1;
        const auto t = std::mktime(&tm);
        if (t == static_cast<std::time_t>(-1)) return std::nullopt;
        return t;
    }

    if (iso[pos] == 'Z' && pos + 1 == iso.size()) return timegm(&tm);

    if (iso[pos] != '+' && iso[pos] != '-') return std::nullopt;
    const int sign = iso[pos] == '-' ? -1 : 1;
    ++pos;

    int offH, offM;
    if (!readDigits(iso, pos, 2, offH)) return std::nullopt;
    if (pos < iso.size() && iso[pos] == ':') ++pos;
    if (!readDigits(iso, pos, 2, offM) || pos != iso.size()) return std::nullopt;

    return timegm(&tm) - sign * (offH * 3600 + offM * 60);
}

std::optional<std::time_t> fileModifiedTime(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const auto ftime = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    const auto sys = std::chrono::file_clock::to_sys(ftime);
    return std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys));
}

}
