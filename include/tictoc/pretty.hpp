#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace tictoc {

/*
    human readable elapsed time

        372         -> "372 ns"
        1500        -> "1.500 us"
        2000000     -> "2 ms"
        90 s        -> "00:01:30"
        1 day 90 s  -> "1 days 00:01:30"

    exact values print as integers, others with three decimals of the
    unit, a minute or more as HH:MM:SS with whole days in front.
    negative input never throws but is not guaranteed to read well.
 */
auto pretty(int64_t nanoseconds) -> std::string;

auto pretty(std::chrono::nanoseconds elapsed) -> std::string;

} // namespace tictoc

#include "tictoc/pretty.ipp"
