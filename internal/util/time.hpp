#pragma once

#include <chrono>
#include <cstdint>

namespace backupmeta::util {

/*
  Time utilities; the single place that reads the wall clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);

int64_t NowMillis();

} // namespace backupmeta::util
