#pragma once

#include "tictoc/defer.hpp"
#include "tictoc/wait_group.hpp"
#include <utility>

namespace tictoc {

inline WaitGroup::~WaitGroup() { drain(); }

inline void WaitGroup::add(size_t n) {
    std::unique_lock<std::mutex> _(mtx_);
    count_ += n;
}

inline void WaitGroup::done() {
    // notify under the lock, a woken waiter may destroy *this right after
    std::unique_lock<std::mutex> _(mtx_);
    if (count_ > 0) {
        --count_;
    }
    cv_.notify_all();
}

inline void WaitGroup::go(std::function<void()> &&f) {
    add();
    std::thread([this, f = std::move(f)] {
        tictoc_defer([this]() { done(); });
        try {
            f();
        } catch (...) {
            fail(std::current_exception());
        }
    }).detach();
}

inline void WaitGroup::fail(std::exception_ptr e) {
    std::unique_lock<std::mutex> _(mtx_);
    if (!error_)
        error_ = std::move(e);
}

inline void WaitGroup::drain() {
    std::unique_lock<std::mutex> ul(mtx_);
    cv_.wait(ul, [this] { return count_ == 0; });
}

inline void WaitGroup::wait() {
    std::exception_ptr e;
    {
        std::unique_lock<std::mutex> ul(mtx_);
        cv_.wait(ul, [this] { return count_ == 0; });
        e = std::exchange(error_, nullptr);
    }
    if (e)
        std::rethrow_exception(e);
}

inline size_t WaitGroup::pending() {
    std::unique_lock<std::mutex> _(mtx_);
    return count_;
}

} // namespace tictoc
