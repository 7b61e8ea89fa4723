#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace tictoc {
/*
    GO style wait group

    Also the execution context of the asynchronous timers: anything with
    a go(std::function<void()> &&) member can take its place.
 */
class WaitGroup {

  public:
    WaitGroup() = default;
    ~WaitGroup(); // waits, drops a pending task error

    WaitGroup(const WaitGroup &) = delete;
    WaitGroup &operator=(const WaitGroup &) = delete;

    void add(size_t n = 1);

    void done();

    // run f on a detached thread, counted until it returns or throws.
    // the first exception thrown by such a task is kept for wait()
    void go(std::function<void()> &&f);

    // blocks until the count reaches zero, then rethrows the first task
    // error, once
    void wait();

    size_t pending();

  private:
    void fail(std::exception_ptr e);
    void drain();

    size_t count_ = 0;
    std::exception_ptr error_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace tictoc

#include "tictoc/wait_group.ipp"
