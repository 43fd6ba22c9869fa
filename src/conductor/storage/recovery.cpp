#include "conductor/storage/recovery.hpp"

#include "conductor/model/serialization.hpp"
#include "conductor/model/state_strings.hpp"
#include "conductor/util/log.hpp"

#include <unordered_set>
#include <utility>

namespace conductor {

namespace {

template <NamedEnum E>
auto parse_column(std::string_view value, std::string_view what)
    -> Result<E> {
  auto parsed = parse<E>(value);
  if (!parsed) {
    log::error("Recovery: unknown {} '{}'", what, value);
    return fail(Error::CorruptState);
  }
  return *parsed;
}

auto decode_column(std::string_view value, std::string_view what)
    -> Result<std::vector<std::string>> {
  auto decoded = decode_string_list(value);
  if (!decoded) {
    log::error("Recovery: unreadable {} column", what);
    return fail(Error::CorruptState);
  }
  return decoded;
}

auto to_subtask(const SubtaskRow& row, const TaskId& task_id)
    -> Result<Subtask> {
  if (row.task_id != task_id.str() || row.id.empty()) {
    return fail(Error::CorruptState);
  }
  auto status = parse_column<SubtaskStatus>(row.status, "subtask status");
  if (!status) return fail(status.error());
  auto deps = decode_column(row.depends_on, "depends_on");
  if (!deps) return fail(deps.error());

  Subtask s;
  s.id = SubtaskId{row.id};
  s.task_id = task_id;
  s.description = row.description;
  s.capability = row.capability;
  s.status = *status;
  for (auto& dep : *deps) {
    s.depends_on.emplace_back(std::move(dep));
  }
  return s;
}

auto to_attempt(const AttemptRow& row) -> Result<AgentAttempt> {
  auto strategy = parse_column<Strategy>(row.strategy, "strategy");
  if (!strategy) return fail(strategy.error());
  auto outcome = parse_column<Outcome>(row.outcome, "outcome");
  if (!outcome) return fail(outcome.error());
  auto touched = decode_column(row.touched_files, "touched_files");
  if (!touched) return fail(touched.error());

  AgentAttempt a;
  a.subtask_id = SubtaskId{row.subtask_id};
  a.attempt = row.attempt;
  a.strategy = *strategy;
  a.started_at = from_millis(row.started_at);
  a.finished_at = from_millis(row.finished_at);
  a.outcome = *outcome;
  if (!row.signature.empty()) {
    auto sig = parse_column<FailureSignature>(row.signature, "signature");
    if (!sig) return fail(sig.error());
    a.signature = *sig;
  }
  a.error = row.error;
  a.payload = row.payload;
  a.touched_files = std::move(*touched);
  return a;
}

}  // namespace

Recovery::Recovery(Persistence& persistence,
                   std::vector<Strategy> strategy_order)
    : persistence_(persistence), strategy_order_(std::move(strategy_order)) {
}

auto Recovery::load(const TaskId& task_id) -> Result<RecoveredTask> {
  auto task_row = persistence_.get_task(task_id.str());
  if (!task_row) {
    return fail(task_row.error());
  }
  auto complexity =
      parse_column<Complexity>(task_row->complexity, "complexity");
  if (!complexity) return fail(complexity.error());

  Task task{
      .id = task_id,
      .description = task_row->description,
      .complexity = *complexity,
      .created_at = from_millis(task_row->created_at),
  };

  auto pipeline_row = persistence_.get_pipeline(task_id.str());
  if (!pipeline_row) {
    log::error("Recovery: task {} has no pipeline row", task_id);
    return fail(pipeline_row.error() == make_error_code(Error::NotFound)
                    ? make_error_code(Error::CorruptState)
                    : pipeline_row.error());
  }

  PipelineState state;
  state.task_id = task_id;
  state.retry_count = pipeline_row->retry_count;
  state.max_retries = pipeline_row->max_retries;
  state.reason = pipeline_row->reason;
  auto stage = parse_column<TaskStage>(pipeline_row->stage, "stage");
  if (!stage) return fail(stage.error());
  state.stage = *stage;

  auto patterns =
      decode_column(pipeline_row->failure_patterns, "failure_patterns");
  if (!patterns) return fail(patterns.error());
  for (const auto& name : *patterns) {
    auto sig = parse_column<FailureSignature>(name, "signature");
    if (!sig) return fail(sig.error());
    state.failure_patterns.push_back(*sig);
  }

  auto subtask_rows = persistence_.get_subtasks(task_id.str());
  if (!subtask_rows) return fail(subtask_rows.error());

  std::vector<Subtask> subtasks;
  std::unordered_set<std::string> known;
  int requeued = 0;
  for (const auto& row : *subtask_rows) {
    auto subtask = to_subtask(row, task_id);
    if (!subtask) return fail(subtask.error());
    if (subtask->status == SubtaskStatus::Running ||
        subtask->status == SubtaskStatus::Ready) {
      if (subtask->status == SubtaskStatus::Running) {
        log::info("Recovery: {} was running during crash, back to pending",
                  subtask->id);
        ++requeued;
      }
      subtask->status = SubtaskStatus::Pending;
    }
    known.insert(subtask->id.str());
    subtasks.push_back(std::move(*subtask));
  }

  auto graph = SubtaskGraph::from_subtasks(std::move(subtasks));
  if (!graph) {
    log::error("Recovery: subtask graph of {} is invalid: {}", task_id,
               graph.error().message());
    return fail(Error::CorruptState);
  }

  auto attempt_rows = persistence_.get_attempts(task_id.str());
  if (!attempt_rows) return fail(attempt_rows.error());
  for (const auto& row : *attempt_rows) {
    if (!known.contains(row.subtask_id)) {
      log::error("Recovery: attempt for unknown subtask {}", row.subtask_id);
      return fail(Error::CorruptState);
    }
    auto attempt = to_attempt(row);
    if (!attempt) return fail(attempt.error());
    state.attempts.push_back(std::move(*attempt));
  }

  auto transition_rows = persistence_.get_transitions(task_id.str());
  if (!transition_rows) return fail(transition_rows.error());
  for (const auto& row : *transition_rows) {
    auto from = parse_column<TaskStage>(row.from, "stage");
    if (!from) return fail(from.error());
    auto to = parse_column<TaskStage>(row.to, "stage");
    if (!to) return fail(to.error());
    state.transitions.push_back(
        StageTransition{.from = *from, .to = *to, .at = from_millis(row.at)});
  }

  auto tracker = PipelineStateTracker::restore(
      std::move(task), std::move(state), strategy_order_);
  if (!tracker) {
    return fail(tracker.error());
  }

  log::info("Recovery: loaded {} at stage {} with {} attempt(s)", task_id,
            to_string_view(tracker->stage()), tracker->state().attempts.size());
  return RecoveredTask{
      .tracker = std::move(*tracker),
      .graph = std::move(*graph),
      .requeued = requeued,
  };
}

auto Recovery::incomplete_tasks() -> Result<std::vector<TaskId>> {
  auto ids = persistence_.get_incomplete_tasks();
  if (!ids) {
    log::error("Failed to list incomplete tasks");
    return fail(ids.error());
  }
  std::vector<TaskId> tasks;
  tasks.reserve(ids->size());
  for (auto& id : *ids) {
    tasks.emplace_back(std::move(id));
  }
  log::info("Found {} incomplete task(s)", tasks.size());
  return tasks;
}

}  // namespace conductor
