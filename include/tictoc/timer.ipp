#pragma once

#include "tictoc/pretty.hpp"
#include "tictoc/timer.hpp"
#include <fmt/printf.h>
#include <functional>
#include <stdexcept>
#include <utility>

namespace tictoc {

namespace internal {

template <class T>
auto share(std::future<T> &&f) -> std::shared_future<T> {
    return f.share();
}

template <class T>
auto share(std::shared_future<T> f) -> std::shared_future<T> {
    return f;
}

// throws fmt::format_error when format cannot take a single string
inline void check_format(const std::string &format) {
    static_cast<void>(fmt::sprintf(format, std::string{}));
}

} // namespace internal

inline Timer::Timer() : Timer(default_clock()) {}

inline Timer::Timer(std::shared_ptr<const Clock> clock)
    : clock_{std::move(clock)} {
    if (!clock_)
        throw std::invalid_argument("tictoc::Timer needs a clock");
}

inline auto Timer::clock() const -> const Clock & { return *clock_; }

template <class Body>
auto Timer::time(const NanosReporter &report, Body &&body) const
    -> std::invoke_result_t<Body> {
    using Result = std::invoke_result_t<Body>;

    auto start = clock_->now();
    if constexpr (std::is_void_v<Result>) {
        std::invoke(std::forward<Body>(body));
        report(clock_->now() - start);
    } else {
        Result result = std::invoke(std::forward<Body>(body));
        report(clock_->now() - start);
        if constexpr (std::is_reference_v<Result>)
            return std::forward<Result>(result);
        else
            return result;
    }
}

template <class Body>
auto Timer::time_pretty(const TextReporter &report, Body &&body) const
    -> std::invoke_result_t<Body> {
    return time([&report](int64_t ns) { report(pretty(ns)); },
                std::forward<Body>(body));
}

template <class Body>
auto Timer::time_pretty_format(const std::string &format,
                               const TextReporter &report, Body &&body) const
    -> std::invoke_result_t<Body> {
    internal::check_format(format);
    return time_pretty(
        [&format, &report](const std::string &p) {
            report(fmt::sprintf(format, p));
        },
        std::forward<Body>(body));
}

template <class Producer, class Executor>
auto Timer::time_future(NanosReporter report, Producer &&producer,
                        Executor &executor) const
    -> internal::shared_future_t<Producer> {
    auto start = clock_->now();
    auto future = internal::share(std::invoke(std::forward<Producer>(producer)));
    if (!future.valid())
        throw std::future_error(std::future_errc::no_state);

    executor.go([clock = clock_, start, future, report = std::move(report)]() {
        future.wait();
        report(clock->now() - start);
    });
    return future;
}

template <class Producer, class Executor>
auto Timer::time_future_pretty(TextReporter report, Producer &&producer,
                               Executor &executor) const
    -> internal::shared_future_t<Producer> {
    return time_future(
        [report = std::move(report)](int64_t ns) { report(pretty(ns)); },
        std::forward<Producer>(producer), executor);
}

template <class Producer, class Executor>
auto Timer::time_future_pretty_format(std::string format, TextReporter report,
                                      Producer &&producer,
                                      Executor &executor) const
    -> internal::shared_future_t<Producer> {
    internal::check_format(format);
    return time_future_pretty(
        [format = std::move(format),
         report = std::move(report)](const std::string &p) {
            report(fmt::sprintf(format, p));
        },
        std::forward<Producer>(producer), executor);
}

inline auto default_timer() -> const Timer & {
    static const Timer timer{};
    return timer;
}

template <class Body>
auto time(const NanosReporter &report, Body &&body)
    -> std::invoke_result_t<Body> {
    return default_timer().time(report, std::forward<Body>(body));
}

template <class Body>
auto time_pretty(const TextReporter &report, Body &&body)
    -> std::invoke_result_t<Body> {
    return default_timer().time_pretty(report, std::forward<Body>(body));
}

template <class Body>
auto time_pretty_format(const std::string &format, const TextReporter &report,
                        Body &&body) -> std::invoke_result_t<Body> {
    return default_timer().time_pretty_format(format, report,
                                              std::forward<Body>(body));
}

template <class Producer, class Executor>
auto time_future(NanosReporter report, Producer &&producer, Executor &executor)
    -> internal::shared_future_t<Producer> {
    return default_timer().time_future(
        std::move(report), std::forward<Producer>(producer), executor);
}

template <class Producer, class Executor>
auto time_future_pretty(TextReporter report, Producer &&producer,
                        Executor &executor)
    -> internal::shared_future_t<Producer> {
    return default_timer().time_future_pretty(
        std::move(report), std::forward<Producer>(producer), executor);
}

template <class Producer, class Executor>
auto time_future_pretty_format(std::string format, TextReporter report,
                               Producer &&producer, Executor &executor)
    -> internal::shared_future_t<Producer> {
    return default_timer().time_future_pretty_format(
        std::move(format), std::move(report), std::forward<Producer>(producer),
        executor);
}

} // namespace tictoc
