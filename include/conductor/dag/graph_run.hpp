#pragma once

#include "conductor/core/error.hpp"
#include "conductor/dag/dag.hpp"
#include "conductor/model/types.hpp"

#include <array>
#include <cstddef>
#include <set>
#include <vector>

namespace conductor {

// Status bookkeeping for one execution of a SubtaskGraph.
//
// Initial statuses are taken from the graph's subtasks, so a graph rebuilt
// from persisted state resumes where it stopped: succeeded subtasks unlock
// their dependents, failed ones keep their dependents skipped, and anything
// that was running is treated as pending again.
class GraphRun {
public:
  explicit GraphRun(SubtaskGraph graph);

  [[nodiscard]] auto graph() const noexcept -> const SubtaskGraph& {
    return graph_;
  }

  // Subtasks whose dependencies have all succeeded, in index order.
  [[nodiscard]] auto ready() const -> std::vector<NodeIndex>;
  [[nodiscard]] auto is_ready(NodeIndex idx) const -> bool {
    return ready_.contains(idx);
  }

  // Ready -> Running. Fails with IllegalTransition unless every dependency
  // has succeeded.
  [[nodiscard]] auto mark_started(NodeIndex idx) -> Result<void>;
  // Running -> Succeeded; dependents whose last dependency this was become
  // ready.
  [[nodiscard]] auto mark_succeeded(NodeIndex idx) -> Result<void>;
  // Running -> Ready, for a failed attempt that will be retried.
  [[nodiscard]] auto requeue(NodeIndex idx) -> Result<void>;
  // Running or Ready -> Failed. Every transitive dependent not yet terminal
  // is skipped; the skipped subtasks are returned.
  [[nodiscard]] auto mark_failed(NodeIndex idx)
      -> Result<std::vector<NodeIndex>>;
  // Skips every subtask that has not started. Running subtasks are left
  // alone so their outcome can still be recorded.
  auto cancel() -> std::vector<NodeIndex>;

  [[nodiscard]] auto status(NodeIndex idx) const -> SubtaskStatus;
  [[nodiscard]] auto count(SubtaskStatus status) const noexcept
      -> std::size_t {
    return counts_[static_cast<std::size_t>(status)];
  }

  // A subtask is critical when others depend on it, or when it is the only
  // sink (its result is the task's result).
  [[nodiscard]] auto is_critical(NodeIndex idx) const -> bool;

  // No subtask is pending, ready or running.
  [[nodiscard]] auto is_complete() const noexcept -> bool;

  // Subtasks in graph order with their current status applied.
  [[nodiscard]] auto snapshot() const -> std::vector<Subtask>;

private:
  auto set_status(NodeIndex idx, SubtaskStatus status) -> void;
  auto unlock_dependents(NodeIndex idx) -> void;
  auto skip_downstream(NodeIndex idx) -> std::vector<NodeIndex>;

  SubtaskGraph graph_;
  std::vector<SubtaskStatus> statuses_;
  std::vector<std::size_t> unmet_deps_;
  std::set<NodeIndex> ready_;
  std::array<std::size_t, 6> counts_{};
  std::size_t sink_count_{0};
};

}  // namespace conductor
