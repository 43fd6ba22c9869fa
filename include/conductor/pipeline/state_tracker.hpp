#pragma once

#include "conductor/core/error.hpp"
#include "conductor/model/types.hpp"
#include "conductor/util/id.hpp"

#include <optional>
#include <string>
#include <vector>

namespace conductor {

inline constexpr int kDefaultMaxRetries = 3;

[[nodiscard]] auto default_strategy_order() -> std::vector<Strategy>;

// Everything recorded about one task's trip through the pipeline. Attempts
// and transitions are append-only.
struct PipelineState {
  TaskId task_id;
  TaskStage stage{TaskStage::Submitted};
  std::vector<AgentAttempt> attempts;
  std::vector<StageTransition> transitions;
  // Failed attempts across the whole task, saturating at max_retries.
  int retry_count{0};
  int max_retries{kDefaultMaxRetries};
  // Distinct signatures in the order they were first seen.
  std::vector<FailureSignature> failure_patterns;
  // Why the task reached its terminal stage; empty while running.
  std::string reason;
};

// Owns the authoritative history of what was tried for a task and decides
// the next retry strategy. What a subtask already tried is derived only by
// scanning the attempt list, so replaying the same history into a fresh
// tracker reproduces every decision.
//
// Not synchronized: a tracker belongs to exactly one task.
class PipelineStateTracker {
public:
  explicit PipelineStateTracker(Task task,
                                int max_retries = kDefaultMaxRetries,
                                std::vector<Strategy> strategy_order =
                                    default_strategy_order());

  // Rebuilds a tracker from persisted state. Inconsistent history
  // (non-contiguous attempt numbers, a retry count that disagrees with the
  // failures, a broken transition chain) yields Error::CorruptState.
  [[nodiscard]] static auto restore(Task task, PipelineState state,
                                    std::vector<Strategy> strategy_order =
                                        default_strategy_order())
      -> Result<PipelineStateTracker>;

  // Appends an attempt. Attempt number 0 is assigned the next number for its
  // subtask; any other number must be exactly that. Failed attempts without
  // a signature are classified from their error text.
  [[nodiscard]] auto record_attempt(AgentAttempt attempt)
      -> Result<AgentAttempt>;

  // First strategy in the configured order the subtask has not tried yet.
  // A subtask that has never run always gets the first strategy; otherwise
  // nullopt once retries or strategies are exhausted.
  [[nodiscard]] auto next_strategy(const SubtaskId& subtask_id) const
      -> std::optional<Strategy>;

  // Moves the stage forward. Moving backwards or out of a terminal stage is
  // IllegalTransition; moving to the current stage is a no-op.
  [[nodiscard]] auto transition(TaskStage to, std::string reason = {})
      -> Result<void>;

  // Transitions to Escalated (unless already terminal) and builds the
  // hand-off record.
  [[nodiscard]] auto escalate() -> EscalationRecord;

  [[nodiscard]] auto build_escalation_record() const -> EscalationRecord;

  [[nodiscard]] auto task() const noexcept -> const Task& {
    return task_;
  }
  [[nodiscard]] auto state() const noexcept -> const PipelineState& {
    return state_;
  }
  [[nodiscard]] auto stage() const noexcept -> TaskStage {
    return state_.stage;
  }
  [[nodiscard]] auto retry_count() const noexcept -> int {
    return state_.retry_count;
  }
  [[nodiscard]] auto max_retries() const noexcept -> int {
    return state_.max_retries;
  }
  [[nodiscard]] auto strategy_order() const noexcept
      -> const std::vector<Strategy>& {
    return strategy_order_;
  }

  [[nodiscard]] auto attempts_for(const SubtaskId& subtask_id) const
      -> std::vector<AgentAttempt>;
  [[nodiscard]] auto tried_strategies(const SubtaskId& subtask_id) const
      -> std::vector<Strategy>;
  // Union of files touched by any attempt, first-seen order.
  [[nodiscard]] auto touched_files() const -> std::vector<std::string>;
  // Most frequent signature among failed attempts; ties go to the earliest.
  [[nodiscard]] auto dominant_signature() const
      -> std::optional<FailureSignature>;

private:
  Task task_;
  PipelineState state_;
  std::vector<Strategy> strategy_order_;
};

}  // namespace conductor
