#pragma once

#include "tictoc/clock.hpp"
#include "tictoc/defer.hpp"
#include "tictoc/pretty.hpp"
#include "tictoc/reporter.hpp"
#include "tictoc/timer.hpp"
#include "tictoc/wait_group.hpp"
