#pragma once
#include "tictoc/defer.hpp"
#include <utility>

namespace tictoc {

inline Defer::Defer(std::function<void()> f) : f_{std::move(f)} {}
inline Defer::~Defer() {
    if (f_)
        f_();
}

} // namespace tictoc
