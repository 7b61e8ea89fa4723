#pragma once

#include "tictoc/clock.hpp"
#include "tictoc/reporter.hpp"
#include <future>
#include <memory>
#include <string>
#include <type_traits>

namespace tictoc {

namespace internal {

template <class F>
struct shared_future_of;

template <class T>
struct shared_future_of<std::future<T>> {
    using type = std::shared_future<T>;
};

template <class T>
struct shared_future_of<std::shared_future<T>> {
    using type = std::shared_future<T>;
};

// std::shared_future<T> for a producer returning std::future<T> or
// std::shared_future<T>
template <class Producer>
using shared_future_t = typename shared_future_of<
    std::decay_t<std::invoke_result_t<Producer>>>::type;

} // namespace internal

/*
    times blocks of code and asynchronous completions

    the synchronous forms report only when the body returns, an exception
    from the body skips the report. the future forms report once the
    future is ready, value or exception alike.

        timer.time_pretty_format("loaded index in %s", print_text(),
                                 [&]() { return load_index(path); });
 */
class Timer {
  public:
    // on default_clock()
    Timer();

    // throws std::invalid_argument on a null clock
    explicit Timer(std::shared_ptr<const Clock> clock);

    auto clock() const -> const Clock &;

    /******************************
          synchronous

        body is any nullary callable, its result is returned as is
     **************************************/
    template <class Body>
    auto time(const NanosReporter &report, Body &&body) const
        -> std::invoke_result_t<Body>;

    template <class Body>
    auto time_pretty(const TextReporter &report, Body &&body) const
        -> std::invoke_result_t<Body>;

    // format takes the pretty time at its %s, a malformed format throws
    // fmt::format_error before body runs
    template <class Body>
    auto time_pretty_format(const std::string &format,
                            const TextReporter &report, Body &&body) const
        -> std::invoke_result_t<Body>;

    /***************************************
         asynchronous

        producer returns std::future<T> or std::shared_future<T> and is
        called once, after the start instant. the returned shared future
        shares its state. the report runs on executor.go(), which must
        keep the observer alive until the future is ready. a throwing
        report belongs to the executor, WaitGroup rethrows it from wait(),
        and never reaches the future.
     ********************************/
    template <class Producer, class Executor>
    auto time_future(NanosReporter report, Producer &&producer,
                     Executor &executor) const
        -> internal::shared_future_t<Producer>;

    template <class Producer, class Executor>
    auto time_future_pretty(TextReporter report, Producer &&producer,
                            Executor &executor) const
        -> internal::shared_future_t<Producer>;

    template <class Producer, class Executor>
    auto time_future_pretty_format(std::string format, TextReporter report,
                                   Producer &&producer,
                                   Executor &executor) const
        -> internal::shared_future_t<Producer>;

  private:
    std::shared_ptr<const Clock> clock_;
};

// process wide Timer on default_clock()
auto default_timer() -> const Timer &;

template <class Body>
auto time(const NanosReporter &report, Body &&body)
    -> std::invoke_result_t<Body>;

template <class Body>
auto time_pretty(const TextReporter &report, Body &&body)
    -> std::invoke_result_t<Body>;

template <class Body>
auto time_pretty_format(const std::string &format, const TextReporter &report,
                        Body &&body) -> std::invoke_result_t<Body>;

template <class Producer, class Executor>
auto time_future(NanosReporter report, Producer &&producer, Executor &executor)
    -> internal::shared_future_t<Producer>;

template <class Producer, class Executor>
auto time_future_pretty(TextReporter report, Producer &&producer,
                        Executor &executor)
    -> internal::shared_future_t<Producer>;

template <class Producer, class Executor>
auto time_future_pretty_format(std::string format, TextReporter report,
                               Producer &&producer, Executor &executor)
    -> internal::shared_future_t<Producer>;

} // namespace tictoc

#include "tictoc/timer.ipp"
