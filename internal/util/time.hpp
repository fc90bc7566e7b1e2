#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace zreplicate::util {

/*
  Time utilities; the one place that picks the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t millis);

// UTC, second precision: 2024-01-31T23:59:59Z
std::string FormatIso8601(TimePoint tp);

double ElapsedMillis(std::chrono::steady_clock::time_point since);

} // namespace zreplicate::util
