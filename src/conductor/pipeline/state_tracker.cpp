#include "conductor/pipeline/state_tracker.hpp"

#include "conductor/model/state_strings.hpp"
#include "conductor/pipeline/failure_classifier.hpp"
#include "conductor/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <utility>

namespace conductor {

namespace {

auto count_attempts(const std::vector<AgentAttempt>& attempts,
                    const SubtaskId& subtask_id) -> int {
  return static_cast<int>(std::ranges::count_if(
      attempts, [&](const auto& a) { return a.subtask_id == subtask_id; }));
}

auto push_unique(std::vector<std::string>& out, const std::string& value)
    -> void {
  if (std::ranges::find(out, value) == out.end()) {
    out.push_back(value);
  }
}

}  // namespace

auto default_strategy_order() -> std::vector<Strategy> {
  return {Strategy::Direct, Strategy::MechanicalFix, Strategy::Regenerate,
          Strategy::Simplify};
}

PipelineStateTracker::PipelineStateTracker(Task task, int max_retries,
                                           std::vector<Strategy> strategy_order)
    : task_(std::move(task)), strategy_order_(std::move(strategy_order)) {
  if (strategy_order_.empty()) {
    strategy_order_ = default_strategy_order();
  }
  state_.task_id = task_.id;
  state_.max_retries = std::max(max_retries, 0);
}

auto PipelineStateTracker::restore(Task task, PipelineState state,
                                   std::vector<Strategy> strategy_order)
    -> Result<PipelineStateTracker> {
  if (state.task_id != task.id || state.max_retries < 0) {
    return fail(Error::CorruptState);
  }

  std::unordered_map<SubtaskId, int> last_number;
  int failures = 0;
  for (const auto& a : state.attempts) {
    int& last = last_number[a.subtask_id];
    if (a.attempt != last + 1) {
      log::error("Recovery: {} attempt #{} follows #{}", a.subtask_id,
                 a.attempt, last);
      return fail(Error::CorruptState);
    }
    last = a.attempt;
    if (a.outcome == Outcome::Failure) {
      ++failures;
    }
  }
  if (state.retry_count != std::min(failures, state.max_retries)) {
    log::error("Recovery: {} retry_count {} disagrees with {} failures",
               task.id, state.retry_count, failures);
    return fail(Error::CorruptState);
  }

  TaskStage expected = TaskStage::Submitted;
  for (const auto& t : state.transitions) {
    if (t.from != expected) {
      return fail(Error::CorruptState);
    }
    expected = t.to;
  }
  if (expected != state.stage) {
    return fail(Error::CorruptState);
  }

  PipelineStateTracker tracker(std::move(task), state.max_retries,
                               std::move(strategy_order));
  tracker.state_ = std::move(state);
  return tracker;
}

auto PipelineStateTracker::record_attempt(AgentAttempt attempt)
    -> Result<AgentAttempt> {
  if (attempt.subtask_id.empty()) {
    return fail(Error::InvalidArgument);
  }

  int expected = count_attempts(state_.attempts, attempt.subtask_id) + 1;
  if (attempt.attempt == 0) {
    attempt.attempt = expected;
  } else if (attempt.attempt != expected) {
    return fail(Error::InvalidArgument);
  }

  if (attempt.outcome == Outcome::Failure) {
    if (!attempt.signature) {
      attempt.signature = classify_failure(attempt.error);
    }
    if (std::ranges::find(state_.failure_patterns, *attempt.signature) ==
        state_.failure_patterns.end()) {
      state_.failure_patterns.push_back(*attempt.signature);
    }
    state_.retry_count = std::min(state_.retry_count + 1, state_.max_retries);
    log::info("Pipeline[{}]: {} attempt #{} ({}) failed: {} [retry {}/{}]",
              task_.id, attempt.subtask_id, attempt.attempt,
              to_string_view(attempt.strategy),
              to_string_view(*attempt.signature), state_.retry_count,
              state_.max_retries);
  } else {
    attempt.signature.reset();
    log::info("Pipeline[{}]: {} attempt #{} ({}) succeeded", task_.id,
              attempt.subtask_id, attempt.attempt,
              to_string_view(attempt.strategy));
  }

  state_.attempts.push_back(attempt);
  return attempt;
}

auto PipelineStateTracker::next_strategy(const SubtaskId& subtask_id) const
    -> std::optional<Strategy> {
  auto tried = tried_strategies(subtask_id);
  if (tried.empty()) {
    return strategy_order_.front();
  }
  if (state_.retry_count >= state_.max_retries) {
    return std::nullopt;
  }
  for (Strategy s : strategy_order_) {
    if (std::ranges::find(tried, s) == tried.end()) {
      return s;
    }
  }
  return std::nullopt;
}

auto PipelineStateTracker::transition(TaskStage to, std::string reason)
    -> Result<void> {
  TaskStage from = state_.stage;
  if (from == to) {
    return ok();
  }
  if (is_terminal(from)) {
    return fail(Error::IllegalTransition);
  }
  if (!is_terminal(to) &&
      std::to_underlying(to) < std::to_underlying(from)) {
    return fail(Error::IllegalTransition);
  }

  state_.transitions.push_back(
      StageTransition{from, to, std::chrono::system_clock::now()});
  state_.stage = to;
  if (is_terminal(to)) {
    state_.reason = std::move(reason);
  }
  log::info("Pipeline[{}]: {} -> {}", task_.id, to_string_view(from),
            to_string_view(to));
  return ok();
}

auto PipelineStateTracker::escalate() -> EscalationRecord {
  if (!is_terminal(state_.stage)) {
    (void)transition(TaskStage::Escalated, "retries exhausted");
  }
  auto record = build_escalation_record();
  log::warn("Pipeline[{}]: escalated after {} attempts", task_.id,
            record.attempts.size());
  return record;
}

auto PipelineStateTracker::build_escalation_record() const
    -> EscalationRecord {
  EscalationRecord record;
  record.task_id = task_.id;
  record.description = task_.description;
  record.stage = state_.stage;
  record.retry_count = state_.retry_count;
  record.max_retries = state_.max_retries;
  record.attempts = state_.attempts;
  record.failure_signatures = state_.failure_patterns;
  record.touched_files = touched_files();
  record.next_step_hint =
      next_step_hint(dominant_signature().value_or(FailureSignature::Unknown));
  return record;
}

auto PipelineStateTracker::attempts_for(const SubtaskId& subtask_id) const
    -> std::vector<AgentAttempt> {
  std::vector<AgentAttempt> result;
  for (const auto& a : state_.attempts) {
    if (a.subtask_id == subtask_id) {
      result.push_back(a);
    }
  }
  return result;
}

auto PipelineStateTracker::tried_strategies(const SubtaskId& subtask_id) const
    -> std::vector<Strategy> {
  std::vector<Strategy> result;
  for (const auto& a : state_.attempts) {
    if (a.subtask_id == subtask_id &&
        std::ranges::find(result, a.strategy) == result.end()) {
      result.push_back(a.strategy);
    }
  }
  return result;
}

auto PipelineStateTracker::touched_files() const -> std::vector<std::string> {
  std::vector<std::string> result;
  for (const auto& a : state_.attempts) {
    for (const auto& f : a.touched_files) {
      push_unique(result, f);
    }
  }
  return result;
}

auto PipelineStateTracker::dominant_signature() const
    -> std::optional<FailureSignature> {
  std::optional<FailureSignature> best;
  int best_count = 0;
  for (FailureSignature sig : state_.failure_patterns) {
    int n = static_cast<int>(std::ranges::count_if(
        state_.attempts, [sig](const auto& a) { return a.signature == sig; }));
    if (n > best_count) {
      best = sig;
      best_count = n;
    }
  }
  return best;
}

}  // namespace conductor
