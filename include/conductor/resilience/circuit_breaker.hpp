#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/error.hpp"
#include "conductor/model/types.hpp"
#include "conductor/resilience/service_limits.hpp"

#include <cstdint>
#include <string>

namespace conductor {

enum class Admission : std::uint8_t {
  Rejected,
  Allowed,
  // The single trial call admitted after the recovery timeout.
  Probe,
};

// The only legal breaker transitions:
//   Closed   -> Open      failures reached the threshold within the window
//   Open     -> HalfOpen  recovery timeout elapsed
//   HalfOpen -> Closed    probe succeeded
//   HalfOpen -> Open      probe failed
[[nodiscard]] constexpr auto is_legal_transition(CircuitState from,
                                                 CircuitState to) noexcept
    -> bool {
  switch (from) {
    case CircuitState::Closed:
      return to == CircuitState::Open;
    case CircuitState::Open:
      return to == CircuitState::HalfOpen;
    case CircuitState::HalfOpen:
      return to == CircuitState::Closed || to == CircuitState::Open;
  }
  return false;
}

// Not synchronized; ResilienceGovernor serializes access per service key.
class CircuitBreaker {
public:
  CircuitBreaker(std::string name, const ServiceLimits& limits,
                 NowFn clock = default_clock());

  // Closed admits everything. Open admits nothing until the recovery
  // timeout elapses, then moves to HalfOpen and admits exactly one probe.
  [[nodiscard]] auto allow_request() -> Admission;

  // `admitted` is what allow_request() returned for the call. In HalfOpen
  // only the probe's result decides; results of calls admitted earlier are
  // ignored, as they are while Open.
  auto record_success(Admission admitted = Admission::Allowed) -> void;
  auto record_failure(Admission admitted = Admission::Allowed) -> void;

  [[nodiscard]] auto state() const noexcept -> CircuitState {
    return state_;
  }
  [[nodiscard]] auto failure_count() const noexcept -> int {
    return failure_count_;
  }
  [[nodiscard]] auto window_start() const noexcept -> SteadyTime {
    return window_start_;
  }
  [[nodiscard]] auto last_transition() const noexcept -> SteadyTime {
    return last_transition_;
  }
  [[nodiscard]] auto probe_in_flight() const noexcept -> bool {
    return probe_in_flight_;
  }
  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }

private:
  [[nodiscard]] auto transition(CircuitState to, SteadyTime now)
      -> Result<void>;

  std::string name_;
  int failure_threshold_;
  std::chrono::milliseconds failure_window_;
  std::chrono::milliseconds recovery_timeout_;
  NowFn clock_;

  CircuitState state_{CircuitState::Closed};
  int failure_count_{0};
  SteadyTime window_start_;
  SteadyTime last_transition_;
  bool probe_in_flight_{false};
};

}  // namespace conductor
