#pragma once
#include "tictoc/pretty.hpp"
#include <array>
#include <cstddef>
#include <fmt/format.h>

namespace tictoc {

namespace internal {

constexpr int64_t millis_per_second = 1000;
constexpr int64_t millis_per_minute = 60 * millis_per_second;
constexpr int64_t millis_per_hour = 60 * millis_per_minute;
constexpr int64_t millis_per_day = 24 * millis_per_hour;

// days, hours, minutes, seconds
constexpr std::array<int64_t, 4> clock_factors{
    millis_per_day, millis_per_hour, millis_per_minute, millis_per_second};

} // namespace internal

inline auto pretty(int64_t nanoseconds) -> std::string {
    auto ns = nanoseconds;
    auto us = ns / 1000;
    auto ms = ns / 1000000;
    auto s = ns / 1000000000;

    // order matters, exact multiples go before the fractional form
    if (us == 0) {
        return fmt::format("{} ns", ns);
    }
    if (ms == 0) {
        if (ns == us * 1000)
            return fmt::format("{} us", us);
        return fmt::format("{:.3f} us", ns / 1000.0);
    }
    if (s == 0) {
        if (us == ms * 1000)
            return fmt::format("{} ms", ms);
        return fmt::format("{:.3f} ms", us / 1000.0);
    }
    if (s < 60) {
        if (ms == s * 1000)
            return fmt::format("{} s", s);
        return fmt::format("{:.3f} s", ms / 1000.0);
    }

    std::array<int64_t, 4> parts{};
    auto rest = ms;
    for (size_t i = 0; i < internal::clock_factors.size(); i++) {
        parts[i] = rest / internal::clock_factors[i];
        rest %= internal::clock_factors[i];
    }
    auto [days, hours, minutes, seconds] = parts;
    if (days == 0) {
        return fmt::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
    }
    return fmt::format("{} days {:02}:{:02}:{:02}", days, hours, minutes,
                       seconds);
}

inline auto pretty(std::chrono::nanoseconds elapsed) -> std::string {
    return pretty(static_cast<int64_t>(elapsed.count()));
}

} // namespace tictoc
