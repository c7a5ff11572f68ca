#include "util/Clock.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

using namespace latmon;

Timestamp latmon::wall_now() {
    return std::chrono::time_point_cast<Micros>(std::chrono::system_clock::now());
}

std::string latmon::format_iso8601(Timestamp ts) {
    int64_t us   = to_micros(ts);
    int64_t secs = us / 1'000'000;
    int64_t frac = us % 1'000'000;
    if (frac < 0) {
        frac += 1'000'000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(frac));
    return buf;
}

std::optional<Timestamp> latmon::parse_iso8601(const std::string& s) {
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    int64_t frac_us = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 6) frac_us = frac_us * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9) return std::nullopt;
        for (int d = digits; d < 6; ++d) frac_us *= 10;
    }

    std::string zone = s.substr(pos);
    if (zone != "Z" && zone != "+00:00") return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon  = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min  = min;
    tm.tm_sec  = sec;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;

    return from_micros(static_cast<int64_t>(t) * 1'000'000 + frac_us);
}
