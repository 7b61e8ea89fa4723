#pragma once
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>

namespace tictoc {

// receives the elapsed nanoseconds of one timed operation
using NanosReporter = std::function<void(int64_t)>;

// receives the pretty, or pretty and formatted, elapsed time
using TextReporter = std::function<void(const std::string &)>;

// prints "<n> ns" and a newline to out
auto print_nanos(std::FILE *out = stdout) -> NanosReporter;

// prints the text and a newline to out
auto print_text(std::FILE *out = stdout) -> TextReporter;

} // namespace tictoc

#include "tictoc/reporter.ipp"
