#include "conductor/resilience/governor.hpp"

#include "conductor/util/log.hpp"

namespace conductor {

ResilienceGovernor::ResilienceGovernor(ResilienceConfig config, NowFn clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
}

auto ResilienceGovernor::entry(const ServiceKey& key) -> Entry& {
  {
    std::shared_lock lock(entries_mu_);
    if (auto it = entries_.find(key); it != entries_.end()) {
      return *it->second;
    }
  }

  std::unique_lock lock(entries_mu_);
  auto [it, inserted] = entries_.try_emplace(key);
  if (inserted) {
    it->second = std::make_unique<Entry>(key, limits_for(key), clock_);
  }
  return *it->second;
}

auto ResilienceGovernor::admit(const ServiceKey& key) -> Permit {
  auto& e = entry(key);
  std::lock_guard lock(e.mu);

  switch (e.breaker.allow_request()) {
    case Admission::Rejected:
      log::debug("Governor: {} refused, circuit {}", key,
                 e.breaker.probe_in_flight() ? "probing" : "open");
      return Permit{Admission::Rejected};
    case Admission::Probe:
      log::info("Governor: {} admitting recovery probe", key);
      return Permit{Admission::Probe};
    case Admission::Allowed:
      break;
  }

  if (!e.limiter.try_acquire()) {
    log::debug("Governor: {} refused, rate limited", key);
    return Permit{Admission::Rejected};
  }
  return Permit{Admission::Allowed};
}

auto ResilienceGovernor::record(const ServiceKey& key, Outcome outcome,
                                Admission admitted) -> void {
  auto& e = entry(key);
  std::lock_guard lock(e.mu);
  if (outcome == Outcome::Success) {
    e.breaker.record_success(admitted);
  } else {
    e.breaker.record_failure(admitted);
  }
}

auto ResilienceGovernor::state(const ServiceKey& key) -> CircuitState {
  auto& e = entry(key);
  std::lock_guard lock(e.mu);
  return e.breaker.state();
}

auto ResilienceGovernor::failure_count(const ServiceKey& key) -> int {
  auto& e = entry(key);
  std::lock_guard lock(e.mu);
  return e.breaker.failure_count();
}

auto ResilienceGovernor::available_tokens(const ServiceKey& key) -> double {
  auto& e = entry(key);
  std::lock_guard lock(e.mu);
  return e.limiter.available();
}

}  // namespace conductor
