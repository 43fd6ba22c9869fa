#pragma once

#include "conductor/core/clock.hpp"

#include <chrono>

namespace conductor {

// Token bucket with continuous refill. Starts full. Not synchronized;
// ResilienceGovernor serializes access per service key.
class RateLimiter {
public:
  RateLimiter(int capacity, double refill_per_minute,
              NowFn clock = default_clock());

  // Consumes one token if at least one is available.
  [[nodiscard]] auto try_acquire() -> bool;

  [[nodiscard]] auto available() -> double;
  [[nodiscard]] auto capacity() const noexcept -> int {
    return capacity_;
  }
  // Time for one token to accrue.
  [[nodiscard]] auto refill_interval() const -> std::chrono::nanoseconds;

private:
  auto refill() -> void;

  int capacity_;
  double refill_per_minute_;
  NowFn clock_;
  double tokens_;
  SteadyTime last_refill_;
};

}  // namespace conductor
