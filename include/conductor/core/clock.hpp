#pragma once

#include <chrono>
#include <functional>

namespace conductor {

using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

// Time source for components whose behavior depends on elapsed time.
// Defaults to the steady clock; tests substitute a manual clock.
using NowFn = std::function<SteadyTime()>;

[[nodiscard]] inline auto steady_now() -> SteadyTime {
  return SteadyClock::now();
}

[[nodiscard]] inline auto default_clock() -> NowFn {
  return [] { return SteadyClock::now(); };
}

}  // namespace conductor
