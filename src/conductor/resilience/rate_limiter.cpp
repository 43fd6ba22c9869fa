#include "conductor/resilience/rate_limiter.hpp"

#include <algorithm>
#include <cstdint>

namespace conductor {

namespace {

constexpr double kNanosPerMinute = 60.0 * 1'000'000'000.0;
// Absorbs rounding so a full refill interval always yields a whole token.
constexpr double kTokenEpsilon = 1e-9;

}  // namespace

RateLimiter::RateLimiter(int capacity, double refill_per_minute, NowFn clock)
    : capacity_(std::max(capacity, 1)),
      refill_per_minute_(std::max(refill_per_minute, 0.0)),
      clock_(std::move(clock)),
      tokens_(static_cast<double>(capacity_)),
      last_refill_(clock_()) {
}

auto RateLimiter::refill() -> void {
  auto now = clock_();
  if (now <= last_refill_) {
    return;
  }
  auto elapsed_ns = static_cast<double>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now - last_refill_)
          .count());
  tokens_ = std::min(static_cast<double>(capacity_),
                     tokens_ + (elapsed_ns * refill_per_minute_) /
                                   kNanosPerMinute);
  last_refill_ = now;
}

auto RateLimiter::try_acquire() -> bool {
  refill();
  if (tokens_ + kTokenEpsilon < 1.0) {
    return false;
  }
  tokens_ = std::max(tokens_ - 1.0, 0.0);
  return true;
}

auto RateLimiter::available() -> double {
  refill();
  return tokens_;
}

auto RateLimiter::refill_interval() const -> std::chrono::nanoseconds {
  if (refill_per_minute_ <= 0.0) {
    return std::chrono::nanoseconds::max();
  }
  return std::chrono::nanoseconds(
      static_cast<std::int64_t>(kNanosPerMinute / refill_per_minute_));
}

}  // namespace conductor
