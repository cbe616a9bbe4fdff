#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace soundscribe::util {

/*
  Time utilities: single place to control clock source.

  Components that depend on wall time take a ClockFn so tests can
  advance time without sleeping.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

ClockFn SystemClock();

double SecondsBetween(TimePoint from, TimePoint to);

// Local time formatted as YYYYmmdd_HHMMSS.
std::string FormatCompactLocal(TimePoint tp);

} // namespace soundscribe::util
