#pragma once

#include <chrono>
#include <cstdint>

namespace edgesync::util {

/*
  Time utilities. Single place to control the clock source.

  Record timestamps and retention are node-local wall clock; backoff and
  tick scheduling use the steady clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace edgesync::util
