#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace blegw::util {

/*
  Time utilities. Single place to control the clock source.

  The pipeline reasons in whole unix seconds. Components take a UnixClock so
  tests can drive time by hand.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using UnixClock = std::function<std::int64_t()>;

TimePoint Now();

std::int64_t ToUnixSeconds(TimePoint tp);
std::int64_t UnixNow();

} // namespace blegw::util
