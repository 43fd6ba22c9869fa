#pragma once

#include "conductor/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

using TimePoint = std::chrono::system_clock::time_point;

enum class Complexity : std::uint8_t {
  Atomic,
  Simple,
  Moderate,
  Complex,
  Enterprise,
};

enum class ExecutionPattern : std::uint8_t {
  Single,
  Pipeline,
  ForkJoin,
};

enum class SubtaskStatus : std::uint8_t {
  Pending,
  Ready,
  Running,
  Succeeded,
  Failed,
  Skipped,
};

enum class Strategy : std::uint8_t {
  Direct,
  MechanicalFix,
  Regenerate,
  Simplify,
};

enum class TaskStage : std::uint8_t {
  Submitted,
  Routing,
  Implementing,
  Reviewing,
  Testing,
  Complete,
  Failed,
  Escalated,
};

enum class CircuitState : std::uint8_t {
  Closed,
  Open,
  HalfOpen,
};

enum class Outcome : std::uint8_t {
  Success,
  Failure,
};

enum class FailureSignature : std::uint8_t {
  MissingCurrentState,
  MissingTargetFile,
  VagueRequirements,
  SyntaxError,
  TestFailure,
  Timeout,
  Unknown,
};

enum class FailurePolicy : std::uint8_t {
  GracefulDegradation,
  AllOrNothing,
};

[[nodiscard]] constexpr auto is_terminal(TaskStage stage) noexcept -> bool {
  return stage == TaskStage::Complete || stage == TaskStage::Failed ||
         stage == TaskStage::Escalated;
}

[[nodiscard]] constexpr auto is_terminal(SubtaskStatus status) noexcept
    -> bool {
  return status == SubtaskStatus::Succeeded ||
         status == SubtaskStatus::Failed || status == SubtaskStatus::Skipped;
}

struct Task {
  TaskId id;
  std::string description;
  Complexity complexity{Complexity::Atomic};
  TimePoint created_at{};
};

struct Subtask {
  SubtaskId id;
  TaskId task_id;
  std::string description;
  std::string capability;
  std::vector<SubtaskId> depends_on;
  SubtaskStatus status{SubtaskStatus::Pending};
};

struct AgentAttempt {
  SubtaskId subtask_id;
  int attempt{0};
  Strategy strategy{Strategy::Direct};
  TimePoint started_at{};
  TimePoint finished_at{};
  Outcome outcome{Outcome::Failure};
  std::optional<FailureSignature> signature;
  std::string error;
  std::string payload;
  std::vector<std::string> touched_files;
};

struct StageTransition {
  TaskStage from{TaskStage::Submitted};
  TaskStage to{TaskStage::Submitted};
  TimePoint at{};
};

struct EscalationRecord {
  TaskId task_id;
  std::string description;
  TaskStage stage{TaskStage::Escalated};
  int retry_count{0};
  int max_retries{0};
  std::vector<AgentAttempt> attempts;
  std::vector<FailureSignature> failure_signatures;
  std::vector<std::string> touched_files;
  std::string next_step_hint;
};

struct Verdict {
  TaskId task_id;
  TaskStage stage{TaskStage::Submitted};
  std::string reason;
  bool cancelled{false};
  std::vector<SubtaskId> succeeded;
  std::vector<SubtaskId> failed;
  std::vector<SubtaskId> skipped;
  std::vector<std::string> touched_files;
  std::optional<EscalationRecord> escalation;
};

}  // namespace conductor
