#include "sequence_clock.hpp"
#include "tictoc/timer.hpp"
#include "tictoc/wait_group.hpp"
#include <atomic>
#include <chrono>
#include <fmt/format.h>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tictoc;
using namespace std::chrono_literals;
using tictoc::test::SequenceClock;

namespace {

// collects reports from the observer threads
template <class T>
class Reports {
  public:
    void add(T v) {
        std::lock_guard<std::mutex> _(mtx_);
        values_.push_back(std::move(v));
    }
    auto values() -> std::vector<T> {
        std::lock_guard<std::mutex> _(mtx_);
        return values_;
    }

  private:
    std::mutex mtx_;
    std::vector<T> values_;
};

} // namespace

TEST(TimeFuture, ReportsAfterSuccess) {
    auto clock = std::make_shared<SequenceClock>(std::vector<int64_t>{100, 350});
    Timer timer{clock};
    Reports<int64_t> reports;
    std::promise<int> promise;
    WaitGroup wg;

    auto future = timer.time_future([&](int64_t ns) { reports.add(ns); },
                                    [&]() { return promise.get_future(); },
                                    wg);

    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(reports.values().empty());
    EXPECT_EQ(clock->reads(), 1u);

    promise.set_value(42);
    EXPECT_EQ(future.get(), 42);
    wg.wait();

    EXPECT_EQ(reports.values(), std::vector<int64_t>{250});
}

TEST(TimeFuture, ReportsAfterFailure) {
    auto clock = std::make_shared<SequenceClock>(std::vector<int64_t>{0, 9});
    Timer timer{clock};
    Reports<int64_t> reports;
    std::promise<std::string> promise;
    WaitGroup wg;

    auto future = timer.time_future([&](int64_t ns) { reports.add(ns); },
                                    [&]() { return promise.get_future(); },
                                    wg);
    promise.set_exception(
        std::make_exception_ptr(std::runtime_error("unreachable host")));

    EXPECT_THROW(future.get(), std::runtime_error);
    wg.wait();
    EXPECT_EQ(reports.values(), std::vector<int64_t>{9});
}

TEST(TimeFuture, StartIsReadBeforeProducer) {
    auto clock = std::make_shared<SequenceClock>(std::vector<int64_t>{0, 5});
    Timer timer{clock};
    WaitGroup wg;
    auto calls = 0;
    size_t reads_in_producer = 0;

    auto future = timer.time_future(
        [](int64_t) {},
        [&]() {
            calls++;
            reads_in_producer = clock->reads();
            return std::async(std::launch::deferred, []() { return 1; });
        },
        wg);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(reads_in_producer, 1u);
    EXPECT_EQ(future.get(), 1);
    wg.wait();
}

TEST(TimeFuture, SharedFutureKeepsItsState) {
    Timer timer{std::make_shared<SequenceClock>(std::vector<int64_t>{0, 1})};
    WaitGroup wg;
    std::promise<int> promise;
    auto input = promise.get_future().share();

    auto future = timer.time_future([](int64_t) {}, [&]() { return input; },
                                    wg);
    promise.set_value(7);

    EXPECT_EQ(input.get(), 7);
    EXPECT_EQ(future.get(), 7);
    EXPECT_EQ(&input.get(), &future.get());
    wg.wait();
}

TEST(TimeFuture, VoidFuture) {
    Timer timer{std::make_shared<SequenceClock>(std::vector<int64_t>{3, 8})};
    Reports<int64_t> reports;
    WaitGroup wg;
    std::promise<void> promise;

    auto future = timer.time_future([&](int64_t ns) { reports.add(ns); },
                                    [&]() { return promise.get_future(); },
                                    wg);
    promise.set_value();
    future.get();
    wg.wait();

    EXPECT_EQ(reports.values(), std::vector<int64_t>{5});
}

TEST(TimeFuture, InvalidFutureThrows) {
    Timer timer{std::make_shared<SequenceClock>(std::vector<int64_t>{0})};
    WaitGroup wg;

    EXPECT_THROW(timer.time_future([](int64_t) {},
                                   []() { return std::future<int>{}; }, wg),
                 std::future_error);
    EXPECT_EQ(wg.pending(), 0u);
}

TEST(TimeFuture, ProducerExceptionPropagates) {
    Timer timer{std::make_shared<SequenceClock>(std::vector<int64_t>{0})};
    WaitGroup wg;
    auto calls = 0;

    EXPECT_THROW(timer.time_future(
                     [&](int64_t) { calls++; },
                     []() -> std::future<int> {
                         throw std::runtime_error("no connection");
                     },
                     wg),
                 std::runtime_error);
    wg.wait();
    EXPECT_EQ(calls, 0);
}

TEST(TimeFuture, Pretty) {
    Timer timer{
        std::make_shared<SequenceClock>(std::vector<int64_t>{0, 1500000000})};
    Reports<std::string> reports;
    WaitGroup wg;

    auto future = timer.time_future_pretty(
        [&](const std::string &s) { reports.add(s); },
        []() { return std::async(std::launch::async, []() { return 2; }); },
        wg);

    EXPECT_EQ(future.get(), 2);
    wg.wait();
    EXPECT_EQ(reports.values(), std::vector<std::string>{"1.500 s"});
}

TEST(TimeFuture, PrettyFormat) {
    Timer timer{std::make_shared<SequenceClock>(std::vector<int64_t>{0, 250})};
    Reports<std::string> reports;
    WaitGroup wg;

    auto future = timer.time_future_pretty_format(
        "took %s", [&](const std::string &s) { reports.add(s); },
        []() { return std::async(std::launch::async, []() { return 'x'; }); },
        wg);

    EXPECT_EQ(future.get(), 'x');
    wg.wait();
    EXPECT_EQ(reports.values(), std::vector<std::string>{"took 250 ns"});
}

TEST(TimeFuture, PrettyFormatReportsAfterFailure) {
    Timer timer{
        std::make_shared<SequenceClock>(std::vector<int64_t>{0, 3000000})};
    Reports<std::string> reports;
    std::promise<int> promise;
    WaitGroup wg;

    auto future = timer.time_future_pretty_format(
        "query failed after %s",
        [&](const std::string &s) { reports.add(s); },
        [&]() { return promise.get_future(); }, wg);
    promise.set_exception(
        std::make_exception_ptr(std::runtime_error("timeout")));

    EXPECT_THROW(future.get(), std::runtime_error);
    wg.wait();
    EXPECT_EQ(reports.values(),
              std::vector<std::string>{"query failed after 3 ms"});
}

TEST(TimeFuture, ThrowingReporterLeavesFutureIntact) {
    Timer timer{std::make_shared<SequenceClock>(std::vector<int64_t>{0, 1})};
    std::promise<int> promise;
    WaitGroup wg;

    auto future = timer.time_future(
        [](int64_t) { throw std::runtime_error("sink down"); },
        [&]() { return promise.get_future(); }, wg);
    promise.set_value(1);

    EXPECT_EQ(future.get(), 1);
    EXPECT_THROW(wg.wait(), std::runtime_error);
    EXPECT_NO_THROW(wg.wait());
}

TEST(TimeFuture, MalformedFormatThrowsBeforeProducer) {
    auto clock = std::make_shared<SequenceClock>(std::vector<int64_t>{0});
    Timer timer{clock};
    WaitGroup wg;
    auto calls = 0;

    EXPECT_THROW(timer.time_future_pretty_format(
                     "%s then %s", [](const std::string &) {},
                     [&]() {
                         calls++;
                         return std::async(std::launch::deferred, []() {});
                     },
                     wg),
                 fmt::format_error);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(clock->reads(), 0u);
    EXPECT_EQ(wg.pending(), 0u);
}

TEST(TimeFuture, IndependentConcurrentTimings) {
    WaitGroup wg;
    Reports<int64_t> reports;
    std::vector<std::shared_future<int>> futures;

    for (auto i = 0; i < 8; i++) {
        futures.push_back(tictoc::time_future(
            [&](int64_t ns) { reports.add(ns); },
            [i]() {
                return std::async(std::launch::async, [i]() {
                    std::this_thread::sleep_for(1ms);
                    return i;
                });
            },
            wg));
    }
    for (auto i = 0; i < 8; i++) {
        EXPECT_EQ(futures[i].get(), i);
    }
    wg.wait();

    auto values = reports.values();
    ASSERT_EQ(values.size(), 8u);
    for (auto ns : values) {
        EXPECT_GE(ns, 1000000);
    }
}
