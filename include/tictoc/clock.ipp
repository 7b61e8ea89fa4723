#pragma once
#include "tictoc/clock.hpp"
#include <chrono>

namespace tictoc {

inline auto SteadyClock::now() const -> int64_t {
    auto t = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t).count();
}

inline auto default_clock() -> std::shared_ptr<const Clock> {
    static const std::shared_ptr<const Clock> clock =
        std::make_shared<SteadyClock>();
    return clock;
}

} // namespace tictoc
