#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/model/types.hpp"
#include "conductor/resilience/circuit_breaker.hpp"
#include "conductor/resilience/rate_limiter.hpp"
#include "conductor/resilience/service_limits.hpp"
#include "conductor/util/id.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace conductor {

// What admit() granted for one call. Converts to true when the call may go
// ahead; hand `admission` back to record() with the call's outcome.
struct Permit {
  Admission admission{Admission::Rejected};

  explicit operator bool() const noexcept {
    return admission != Admission::Rejected;
  }
  [[nodiscard]] auto is_probe() const noexcept -> bool {
    return admission == Admission::Probe;
  }
};

// Admission control for external services: a circuit breaker in front of a
// token bucket, one pair per service key. Each key has its own mutex, so
// different keys never contend.
//
// admit() == false means "try later"; it is never a failure.
class ResilienceGovernor {
public:
  explicit ResilienceGovernor(ResilienceConfig config,
                              NowFn clock = default_clock());

  ResilienceGovernor(const ResilienceGovernor&) = delete;
  auto operator=(const ResilienceGovernor&) -> ResilienceGovernor& = delete;

  [[nodiscard]] auto admit(const ServiceKey& key) -> Permit;
  // Only the result of a Probe admission can close or reopen a half-open
  // circuit.
  auto record(const ServiceKey& key, Outcome outcome,
              Admission admitted = Admission::Allowed) -> void;
  auto record(const ServiceKey& key, bool success,
              Admission admitted = Admission::Allowed) -> void {
    record(key, success ? Outcome::Success : Outcome::Failure, admitted);
  }

  [[nodiscard]] auto state(const ServiceKey& key) -> CircuitState;
  [[nodiscard]] auto failure_count(const ServiceKey& key) -> int;
  [[nodiscard]] auto available_tokens(const ServiceKey& key) -> double;

  [[nodiscard]] auto limits_for(const ServiceKey& key) const
      -> const ServiceLimits& {
    return config_.limits_for(key.str());
  }

private:
  struct Entry {
    Entry(const ServiceKey& key, const ServiceLimits& limits,
          const NowFn& clock)
        : breaker(key.str(), limits, clock),
          limiter(limits.bucket_capacity, limits.refill_per_minute, clock) {
    }

    std::mutex mu;
    CircuitBreaker breaker;
    RateLimiter limiter;
  };

  auto entry(const ServiceKey& key) -> Entry&;

  ResilienceConfig config_;
  NowFn clock_;
  std::shared_mutex entries_mu_;
  std::unordered_map<ServiceKey, std::unique_ptr<Entry>> entries_;
};

}  // namespace conductor
