#pragma once
#include <cstdint>
#include <memory>

namespace tictoc {

/*
    monotonic nanosecond counter

    now() never goes backwards and is safe to call from any thread,
    subclass it to feed the timers deterministic instants
 */
class Clock {
  public:
    virtual ~Clock() = default;

    virtual auto now() const -> int64_t = 0;
};

// std::chrono::steady_clock, unaffected by wall clock adjustments
class SteadyClock : public Clock {
  public:
    auto now() const -> int64_t override;
};

// process wide SteadyClock, inject another Clock through Timer instead
auto default_clock() -> std::shared_ptr<const Clock>;

} // namespace tictoc

#include "tictoc/clock.ipp"
