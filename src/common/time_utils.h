#pragma once

#include <chrono>
#include <cstdint>

namespace airwaiter {

constexpr int64_t ONE_MINUTE_MS = 60000;

inline std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

inline std::chrono::milliseconds ToMilliseconds(std::chrono::steady_clock::duration duration) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration);
}

/*
 * start + timeout, or the farthest representable time point when the sum does
 * not fit in the clock's duration type.
 */
inline std::chrono::steady_clock::time_point
SaturatingDeadline(std::chrono::steady_clock::time_point start, std::chrono::milliseconds timeout) {
    const auto farthest = std::chrono::steady_clock::time_point::max();
    // compared in milliseconds, converting timeout to clock ticks may overflow
    if (timeout > std::chrono::duration_cast<std::chrono::milliseconds>(farthest - start)) {
        return farthest;
    }
    return start + timeout;
}

/*
 * First tick of the schedule `tick + k * period` (k >= 0) which is after now.
 */
inline std::chrono::steady_clock::time_point NextTickAfter(
    std::chrono::steady_clock::time_point tick,
    std::chrono::steady_clock::time_point now,
    std::chrono::steady_clock::duration period) {
    if (tick > now) {
        return tick;
    }
    auto missed = (now - tick) / period + 1;
    return tick + missed * period;
}

} // namespace airwaiter
