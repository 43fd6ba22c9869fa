#pragma once

#include "conductor/model/types.hpp"
#include "conductor/resilience/service_limits.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace conductor {

struct OrchestratorConfig {
  // 0 selects the number of hardware threads.
  int max_parallelism{0};
  std::chrono::milliseconds subtask_timeout{std::chrono::seconds(120)};
  int max_retries{3};
  std::size_t max_description_bytes{64 * 1024};
  FailurePolicy failure_policy{FailurePolicy::GracefulDegradation};
  std::vector<Strategy> strategy_order{Strategy::Direct, Strategy::MechanicalFix,
                                       Strategy::Regenerate, Strategy::Simplify};
  std::chrono::milliseconds backoff_base{std::chrono::seconds(1)};
  std::chrono::milliseconds backoff_cap{std::chrono::seconds(30)};
  std::size_t max_fan_out{8};

  [[nodiscard]] auto effective_parallelism() const -> std::size_t;
};

struct StorageConfig {
  // Empty disables persistence.
  std::string db_file;
};

struct LoggingConfig {
  std::string level{"info"};
};

struct SystemConfig {
  OrchestratorConfig orchestrator;
  ResilienceConfig resilience;
  StorageConfig storage;
  LoggingConfig logging;
};

}  // namespace conductor
