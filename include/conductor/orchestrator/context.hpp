#pragma once

#include "conductor/config/system_config.hpp"
#include "conductor/core/clock.hpp"
#include "conductor/executor/worker.hpp"
#include "conductor/model/types.hpp"
#include "conductor/pipeline/pattern_learner.hpp"
#include "conductor/resilience/governor.hpp"
#include "conductor/storage/persistence.hpp"
#include "conductor/util/id.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace conductor {

using IntegrationCallback =
    std::function<void(const TaskId&, const std::vector<std::string>&)>;
using EscalationCallback = std::function<void(const EscalationRecord&)>;

// Everything an orchestrator depends on, constructed by the caller. Two
// orchestrators share nothing unless they are handed the same governor,
// learner or store.
struct OrchestratorContext {
  OrchestratorConfig config;
  std::shared_ptr<ResilienceGovernor> governor;
  CapabilityRegistry registry;
  // Optional; not owned. Must outlive the orchestrator.
  Persistence* persistence{nullptr};
  std::shared_ptr<FailurePatternLearner> learner;

  // Invoked on the thread that called execute().
  IntegrationCallback on_ready_for_integration;
  EscalationCallback on_escalation;

  NowFn clock{default_clock()};
};

}  // namespace conductor
