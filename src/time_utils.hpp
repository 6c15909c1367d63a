#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>

// ---------------------------------------------------------------------------
// Time constants and utilities for UTC nanosecond timestamps
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr uint64_t NS_PER_MS          = 1'000'000ULL;
constexpr uint64_t NS_PER_SEC         = 1'000'000'000ULL;
constexpr uint64_t NS_PER_MIN         = 60ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_HOUR        = 60ULL * NS_PER_MIN;
constexpr uint64_t NS_PER_DAY         = 24ULL * NS_PER_HOUR;

inline uint64_t now_ns() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

inline uint64_t minutes_ns(int minutes) {
    return static_cast<uint64_t>(minutes) * NS_PER_MIN;
}

// Saturating subtraction; timestamps near the epoch never wrap.
inline uint64_t minus_ns(uint64_t ts, uint64_t delta) {
    return ts > delta ? ts - delta : 0;
}

inline uint64_t midnight_utc_ns(uint64_t ts) {
    return (ts / NS_PER_DAY) * NS_PER_DAY;
}

// Fractional hour of the UTC day, in [0, 24).
inline float compute_hour_of_day(uint64_t ts) {
    double ns_since_midnight = static_cast<double>(ts - midnight_utc_ns(ts));
    return static_cast<float>(ns_since_midnight / static_cast<double>(NS_PER_HOUR));
}

inline double elapsed_minutes(uint64_t from_ts, uint64_t to_ts) {
    if (to_ts <= from_ts) return 0.0;
    return static_cast<double>(to_ts - from_ts) / static_cast<double>(NS_PER_MIN);
}

}  // namespace time_utils
