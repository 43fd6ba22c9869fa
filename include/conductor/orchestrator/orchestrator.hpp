#pragma once

#include "conductor/core/error.hpp"
#include "conductor/core/worker_pool.hpp"
#include "conductor/dag/graph_run.hpp"
#include "conductor/executor/cancellation.hpp"
#include "conductor/model/types.hpp"
#include "conductor/orchestrator/context.hpp"
#include "conductor/orchestrator/decomposer.hpp"
#include "conductor/pipeline/state_tracker.hpp"
#include "conductor/util/id.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace conductor {

// Drives tasks from submission to a terminal verdict: decomposes each task
// into a subtask graph, dispatches ready subtasks to workers on a bounded
// pool (through the resilience governor), feeds every outcome to the task's
// PipelineStateTracker and escalates once a critical subtask runs out of
// strategies.
//
// Different tasks may be executed from different threads concurrently; a
// single task is executed by one caller at a time.
class TaskOrchestrator {
public:
  explicit TaskOrchestrator(OrchestratorContext context);
  ~TaskOrchestrator();

  TaskOrchestrator(const TaskOrchestrator&) = delete;
  auto operator=(const TaskOrchestrator&) -> TaskOrchestrator& = delete;

  // Rejects an empty or oversized description with Error::InvalidTask
  // before any state exists. Without an explicit tier the complexity is
  // classified from the description.
  [[nodiscard]] auto submit(std::string description,
                            std::optional<Complexity> complexity =
                                std::nullopt) -> Result<TaskId>;
  // Same, for a task id supplied by the issue source.
  [[nodiscard]] auto submit(TaskId task_id, std::string description,
                            std::optional<Complexity> complexity =
                                std::nullopt) -> Result<TaskId>;

  // Builds the subtask graph and moves the task to routing. A task is
  // decomposed once; execute() does it implicitly.
  [[nodiscard]] auto decompose(const TaskId& task_id)
      -> Result<DecompositionPlan>;

  // Installs a caller-built subtask graph instead of decomposing.
  [[nodiscard]] auto set_plan(const TaskId& task_id,
                              std::vector<Subtask> subtasks) -> Result<void>;

  // Runs the task to a terminal stage and returns its verdict. Calling it
  // again on a finished task returns the same verdict.
  [[nodiscard]] auto execute(const TaskId& task_id) -> Result<Verdict>;

  // Not-yet-started subtasks are skipped; running ones finish and are
  // recorded. Safe to call from any thread.
  [[nodiscard]] auto cancel(const TaskId& task_id) -> Result<void>;

  // Loads a task from the configured store. Error::CorruptState if its
  // history cannot be trusted.
  [[nodiscard]] auto resume(const TaskId& task_id) -> Result<void>;

  // Not synchronized with a concurrent execute() of the same task.
  [[nodiscard]] auto tracker(const TaskId& task_id) const
      -> const PipelineStateTracker*;
  [[nodiscard]] auto subtasks(const TaskId& task_id) const
      -> Result<std::vector<Subtask>>;

  [[nodiscard]] auto context() const noexcept -> const OrchestratorContext& {
    return ctx_;
  }

private:
  struct TaskEntry {
    explicit TaskEntry(PipelineStateTracker t) : tracker(std::move(t)) {
    }

    std::mutex mu;
    PipelineStateTracker tracker;
    std::optional<GraphRun> run;
    CancellationSource cancellation;
    bool executing{false};
    std::optional<Verdict> verdict;
  };

  class Execution;

  [[nodiscard]] auto find(const TaskId& task_id) const
      -> std::shared_ptr<TaskEntry>;
  // Callers hold entry.mu or own the entry through execute().
  [[nodiscard]] auto plan_task(TaskEntry& entry) -> Result<DecompositionPlan>;
  [[nodiscard]] auto install_graph(TaskEntry& entry, SubtaskGraph graph)
      -> Result<void>;
  [[nodiscard]] auto missing_capability(const GraphRun& run) const
      -> std::optional<std::string>;

  // Terminal bookkeeping: stage, callbacks, learner, snapshot.
  auto finish(TaskEntry& entry, TaskStage stage, std::string reason,
              bool cancelled) -> Verdict;
  [[nodiscard]] auto build_verdict(const TaskEntry& entry, bool cancelled) const
      -> Verdict;
  auto persist(const TaskEntry& entry) -> void;
  // Appends what the learner saw recover the task's dominant failure.
  [[nodiscard]] auto with_learned_hint(const PipelineStateTracker& tracker,
                                       EscalationRecord record) const
      -> EscalationRecord;

  OrchestratorContext ctx_;
  Decomposer decomposer_;
  std::unique_ptr<WorkerPool> pool_;
  // Dispatches still awaited. A timed-out dispatch stops counting even if its
  // worker has not returned.
  std::atomic<std::size_t> running_jobs_{0};

  // One connection is shared by every task's snapshots.
  std::mutex persist_mu_;

  mutable std::mutex tasks_mu_;
  std::unordered_map<TaskId, std::shared_ptr<TaskEntry>> tasks_;
};

}  // namespace conductor
