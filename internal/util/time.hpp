#pragma once

#include <chrono>
#include <cstdint>

namespace crumbtrail::util {

/*
  Clock access for the whole pipeline.

  Every persisted timestamp is unix epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t millis);

inline int64_t NowMillis() {
  return ToUnixMillis(Now());
}

} // namespace crumbtrail::util
