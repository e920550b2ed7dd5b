#include "time_utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cmath>
#include <cstdio>

std::optional<std::time_t> parse_iso_utc(const std::string& iso) {
    if (iso.size() < 19) return std::nullopt;

    struct tm tm_buf = {};
    int consumed = 0;
    if (sscanf(iso.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    if (tm_buf.tm_mon < 1 || tm_buf.tm_mon > 12 || tm_buf.tm_mday < 1 ||
        tm_buf.tm_mday > 31 || tm_buf.tm_hour > 23 || tm_buf.tm_min > 59 ||
        tm_buf.tm_sec > 60) {
        return std::nullopt;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    std::time_t t = timegm(&tm_buf);

    // Skip fractional seconds (sub-second precision is not tracked)
    size_t pos = static_cast<size_t>(consumed);
    if (pos < iso.size() && iso[pos] == '.') {
        ++pos;
        while (pos < iso.size() && iso[pos] >= '0' && iso[pos] <= '9') ++pos;
    }

    if (pos == iso.size() || iso.compare(pos, std::string::npos, "Z") == 0) {
        return t;
    }

    // ±HH:MM or ±HHMM offset
    char sign = iso[pos];
    if (sign != '+' && sign != '-') return std::nullopt;
    int off_h = 0, off_m = 0;
    const char* rest = iso.c_str() + pos + 1;
    if (sscanf(rest, "%2d:%2d", &off_h, &off_m) != 2 &&
        sscanf(rest, "%2d%2d", &off_h, &off_m) != 2) {
        return std::nullopt;
    }
    std::time_t offset = off_h * 3600 + off_m * 60;
    return sign == '+' ? t - offset : t + offset;
}

std::string format_iso_utc(std::time_t t) {
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

std::string now_iso() {
    return format_iso_utc(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

double seconds_between(const std::string& start, const std::string& end) {
    auto s = parse_iso_utc(start);
    auto e = parse_iso_utc(end);
    if (!s || !e) return 0.0;
    return std::difftime(*e, *s);
}

double hours_between(const std::string& start, const std::string& end) {
    double secs = seconds_between(start, end);
    return secs > 0.0 ? secs / 3600.0 : 0.0;
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    auto start_t = parse_iso_utc(start_time);
    if (!start_t) return "?";

    std::time_t end_t;
    if (!end_time.empty()) {
        auto parsed = parse_iso_utc(end_time);
        if (!parsed) return "?";
        end_t = *parsed;
    } else {
        end_t = std::time(nullptr);
    }

    int seconds = static_cast<int>(std::difftime(end_t, *start_t));
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string humanize_duration(double seconds) {
    long secs = std::lround(seconds);
    if (secs < 0) secs = 0;
    if (secs < 60) return fmt::format("{}s", secs);

    long minutes = secs / 60, s = secs % 60;
    if (minutes < 60) return fmt::format("{}m {}s", minutes, s);

    long hours = minutes / 60, m = minutes % 60;
    if (hours < 24) return fmt::format("{}h {}m {}s", hours, m, s);

    long days = hours / 24, h = hours % 24;
    return fmt::format("{}d {}h {}m", days, h, m);
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    auto t = parse_iso_utc(iso_time);
    if (!t) return "?";

    struct tm tm_buf;
    gmtime_r(&*t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M UTC", &tm_buf);
    return std::string(buf);
}
