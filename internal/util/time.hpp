#pragma once

#include <chrono>
#include <cstdint>

namespace typelog::util {

/*
  Time utilities: single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(uint64_t micros);

uint64_t NowMicros();

} // namespace typelog::util
