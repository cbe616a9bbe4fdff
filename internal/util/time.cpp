#include "time.hpp"

#include <ctime>

namespace soundscribe::util {

TimePoint Now() {
  return Clock::now();
}

ClockFn SystemClock() {
  return [] { return Clock::now(); };
}

double SecondsBetween(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

std::string FormatCompactLocal(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  localtime_r(&t, &tm);

  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm) == 0) {
    return {};
  }
  return buf;
}

} // namespace soundscribe::util
