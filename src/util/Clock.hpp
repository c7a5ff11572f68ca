#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace latmon {

using Micros    = std::chrono::microseconds;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, Micros>;

// Wall clock truncated to microseconds.
Timestamp wall_now();

// "2026-10-19T08:15:02.123456Z". Fixed width: lexical order == time order.
std::string format_iso8601(Timestamp ts);

// Accepts the format produced above, plus the "+00:00" offset form and
// fractional seconds of 0-9 digits. nullopt on anything else.
std::optional<Timestamp> parse_iso8601(const std::string& s);

inline int64_t to_micros(Timestamp ts) {
    return ts.time_since_epoch().count();
}

inline Timestamp from_micros(int64_t us) {
    return Timestamp(Micros(us));
}

} // namespace latmon
