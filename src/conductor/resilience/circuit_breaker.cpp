#include "conductor/resilience/circuit_breaker.hpp"

#include "conductor/model/state_strings.hpp"
#include "conductor/util/log.hpp"

#include <algorithm>

namespace conductor {

CircuitBreaker::CircuitBreaker(std::string name, const ServiceLimits& limits,
                               NowFn clock)
    : name_(std::move(name)),
      failure_threshold_(std::max(limits.failure_threshold, 1)),
      failure_window_(limits.failure_window),
      recovery_timeout_(limits.recovery_timeout),
      clock_(std::move(clock)) {
  auto now = clock_();
  window_start_ = now;
  last_transition_ = now;
}

auto CircuitBreaker::transition(CircuitState to, SteadyTime now)
    -> Result<void> {
  if (!is_legal_transition(state_, to)) {
    log::error("CircuitBreaker[{}]: refused transition {} -> {}", name_,
               to_string_view(state_), to_string_view(to));
    return fail(Error::IllegalTransition);
  }
  log::info("CircuitBreaker[{}]: {} -> {}", name_, to_string_view(state_),
            to_string_view(to));
  state_ = to;
  last_transition_ = now;
  return ok();
}

auto CircuitBreaker::allow_request() -> Admission {
  auto now = clock_();
  switch (state_) {
    case CircuitState::Closed:
      return Admission::Allowed;

    case CircuitState::Open:
      if (now - last_transition_ < recovery_timeout_) {
        return Admission::Rejected;
      }
      if (!transition(CircuitState::HalfOpen, now)) {
        return Admission::Rejected;
      }
      probe_in_flight_ = true;
      return Admission::Probe;

    case CircuitState::HalfOpen:
      if (probe_in_flight_) {
        return Admission::Rejected;
      }
      probe_in_flight_ = true;
      return Admission::Probe;
  }
  return Admission::Rejected;
}

auto CircuitBreaker::record_success(Admission admitted) -> void {
  auto now = clock_();
  switch (state_) {
    case CircuitState::HalfOpen:
      if (admitted != Admission::Probe) {
        log::debug("CircuitBreaker[{}]: ignoring success of a pre-probe call",
                   name_);
        break;
      }
      probe_in_flight_ = false;
      if (transition(CircuitState::Closed, now)) {
        failure_count_ = 0;
        window_start_ = now;
      }
      break;

    case CircuitState::Closed:
      if (now - window_start_ >= failure_window_) {
        failure_count_ = 0;
        window_start_ = now;
      }
      break;

    case CircuitState::Open:
      // Result of a call admitted before the breaker opened.
      break;
  }
}

auto CircuitBreaker::record_failure(Admission admitted) -> void {
  auto now = clock_();
  switch (state_) {
    case CircuitState::HalfOpen:
      if (admitted != Admission::Probe) {
        log::debug("CircuitBreaker[{}]: ignoring failure of a pre-probe call",
                   name_);
        break;
      }
      probe_in_flight_ = false;
      (void)transition(CircuitState::Open, now);
      break;

    case CircuitState::Closed:
      if (now - window_start_ >= failure_window_) {
        failure_count_ = 0;
        window_start_ = now;
      }
      if (++failure_count_ >= failure_threshold_) {
        (void)transition(CircuitState::Open, now);
      }
      break;

    case CircuitState::Open:
      break;
  }
}

}  // namespace conductor
