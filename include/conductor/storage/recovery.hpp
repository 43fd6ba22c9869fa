#pragma once

#include "conductor/core/error.hpp"
#include "conductor/dag/dag.hpp"
#include "conductor/pipeline/state_tracker.hpp"
#include "conductor/storage/persistence.hpp"
#include "conductor/util/id.hpp"

#include <vector>

namespace conductor {

struct RecoveredTask {
  PipelineStateTracker tracker;
  // Subtasks that were running at crash time come back as pending.
  SubtaskGraph graph;
  int requeued{0};
};

// Rebuilds tasks from the store. Anything that cannot be read back exactly
// (an unknown enum name, malformed JSON, a dangling or cyclic dependency,
// inconsistent attempt history) is Error::CorruptState; the task has to be
// submitted again.
class Recovery {
public:
  explicit Recovery(Persistence& persistence,
                    std::vector<Strategy> strategy_order =
                        default_strategy_order());

  [[nodiscard]] auto load(const TaskId& task_id) -> Result<RecoveredTask>;

  [[nodiscard]] auto incomplete_tasks() -> Result<std::vector<TaskId>>;

private:
  Persistence& persistence_;
  std::vector<Strategy> strategy_order_;
};

}  // namespace conductor
