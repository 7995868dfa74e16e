#pragma once

#include <chrono>
#include <cstdint>

namespace omni::util {

/*
  Time utilities. Persisted timestamps are unix epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMillis();

} // namespace omni::util
