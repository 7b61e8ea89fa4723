#pragma once
#include "tictoc/reporter.hpp"
#include <fmt/core.h>

namespace tictoc {

inline auto print_nanos(std::FILE *out) -> NanosReporter {
    return [out](int64_t ns) { fmt::print(out, "{} ns\n", ns); };
}

inline auto print_text(std::FILE *out) -> TextReporter {
    return [out](const std::string &text) { fmt::print(out, "{}\n", text); };
}

} // namespace tictoc
