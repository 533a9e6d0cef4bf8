#include "time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <utility>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::optional<std::time_t> parse_rfc3339(const std::string& s) {
    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6)
        return std::nullopt;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t t = timegm(&tm);
    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9')
            ++pos;
    }
    if (pos >= s.size() || s[pos] == 'Z' || s[pos] == 'z')
        return t;
    if (s[pos] == '+' || s[pos] == '-') {
        int hh = 0;
        int mm = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &hh, &mm) < 1)
            return std::nullopt;
        long offset = hh * 3600L + mm * 60L;
        return s[pos] == '+' ? t - offset : t + offset;
    }
    return std::nullopt;
}

std::string format_relative(std::time_t t, std::time_t now) {
    if (now == 0)
        now = std::time(nullptr);
    long long secs = static_cast<long long>(now) - static_cast<long long>(t);
    if (secs < 60)
        return "just now";
    struct Unit {
        long long secs;
        const char* singular;
        const char* plural;
    };
    static const Unit units[] = {{365LL * 86400, "year", "years"}, {30LL * 86400, "month", "months"},
                                 {7LL * 86400, "week", "weeks"},   {86400, "day", "days"},
                                 {3600, "hour", "hours"},          {60, "min", "mins"}};
    for (const auto& u : units) {
        if (secs >= u.secs) {
            long long n = secs / u.secs;
            return std::to_string(n) + " " + (n == 1 ? u.singular : u.plural) + " ago";
        }
    }
    return "just now";
}

std::string format_relative_short(std::time_t t, std::time_t now) {
    if (now == 0)
        now = std::time(nullptr);
    long long secs = static_cast<long long>(now) - static_cast<long long>(t);
    if (secs < 60)
        return "now";
    if (secs >= 30LL * 86400) {
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[16];
        std::strftime(buf, sizeof(buf), "%b %d", &tm);
        return buf;
    }
    static const std::pair<long long, const char*> units[] = {
        {7LL * 86400, "w"}, {86400, "d"}, {3600, "h"}, {60, "m"}};
    for (const auto& [unit, suffix] : units) {
        if (secs >= unit)
            return std::to_string(secs / unit) + suffix + " ago";
    }
    return "now";
}
