#pragma once

#include <chrono>
#include <cstdint>

namespace proposal::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ElapsedMillis(TimePoint since);

} // namespace proposal::util
