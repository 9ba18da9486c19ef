#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace meshgraph::util {

/*
  Time utilities; single place to control clock source later.

  Stored rows carry unix seconds; everything above the repository works with
  TimePoint.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(int64_t seconds);

// Start of the UTC hour containing tp.
TimePoint FloorToHour(TimePoint tp);

// "2026-10-17T13:00:00Z"
std::string FormatIso8601(TimePoint tp);

// "Sat Oct 17 13:05:09 UTC 2026", the format date(1) prints under LC_TIME=C.
std::string FormatCtime(TimePoint tp);

// Accepts "<n>ms", "<n>s", "<n>m", "<n>min", "<n>h", "<n>d". Throws
// std::invalid_argument on anything else.
std::chrono::milliseconds ParseDuration(const std::string& text);

// Compact label used in artifact names: 15min, 1h, 24h, 2d.
std::string DurationLabel(std::chrono::milliseconds duration);

} // namespace meshgraph::util
