#pragma once

#define tictoc_concat_impl(a, b) a##b
#define tictoc_concat(a, b) tictoc_concat_impl(a, b)

// unique identifier per expansion
#define tictoc_anon tictoc_concat(tictoc_anon_, __COUNTER__)
