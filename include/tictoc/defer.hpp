#pragma once
#include "tictoc/anonymous.hpp"
#include <functional>

namespace tictoc {

/*
    runs f when the enclosing scope ends, also while unwinding
 */
class Defer {
  public:
    Defer(std::function<void()> f);
    ~Defer();

    Defer(const Defer &) = delete;
    Defer &operator=(const Defer &) = delete;

  private:
    std::function<void()> f_;
};

} // namespace tictoc

#define tictoc_defer(f) tictoc::Defer tictoc_anon{f};

#include "tictoc/defer.ipp"
