#include "conductor/dag/graph_run.hpp"

namespace conductor {

GraphRun::GraphRun(SubtaskGraph graph) : graph_(std::move(graph)) {
  std::size_t n = graph_.size();
  statuses_.assign(n, SubtaskStatus::Pending);
  unmet_deps_.resize(n);
  counts_[static_cast<std::size_t>(SubtaskStatus::Pending)] = n;

  for (NodeIndex i = 0; i < n; ++i) {
    unmet_deps_[i] = graph_.get_deps_view(i).size();
    if (graph_.get_dependents_view(i).empty()) {
      ++sink_count_;
    }
  }

  std::vector<NodeIndex> blocked;
  for (NodeIndex idx : graph_.get_topological_order()) {
    switch (graph_.subtask(idx).status) {
      case SubtaskStatus::Succeeded:
        set_status(idx, SubtaskStatus::Succeeded);
        unlock_dependents(idx);
        break;
      case SubtaskStatus::Failed:
        set_status(idx, SubtaskStatus::Failed);
        blocked.push_back(idx);
        break;
      case SubtaskStatus::Skipped:
        set_status(idx, SubtaskStatus::Skipped);
        blocked.push_back(idx);
        break;
      default:
        break;
    }
  }

  for (NodeIndex idx : blocked) {
    (void)skip_downstream(idx);
  }

  for (NodeIndex i = 0; i < n; ++i) {
    if (statuses_[i] == SubtaskStatus::Pending && unmet_deps_[i] == 0) {
      set_status(i, SubtaskStatus::Ready);
    }
  }
}

auto GraphRun::set_status(NodeIndex idx, SubtaskStatus status) -> void {
  SubtaskStatus old = statuses_[idx];
  if (old == status) {
    return;
  }
  if (old == SubtaskStatus::Ready) {
    ready_.erase(idx);
  }
  if (status == SubtaskStatus::Ready) {
    ready_.insert(idx);
  }
  --counts_[static_cast<std::size_t>(old)];
  ++counts_[static_cast<std::size_t>(status)];
  statuses_[idx] = status;
}

auto GraphRun::unlock_dependents(NodeIndex idx) -> void {
  for (NodeIndex dep : graph_.get_dependents_view(idx)) {
    if (--unmet_deps_[dep] == 0 && statuses_[dep] == SubtaskStatus::Pending) {
      set_status(dep, SubtaskStatus::Ready);
    }
  }
}

auto GraphRun::skip_downstream(NodeIndex idx) -> std::vector<NodeIndex> {
  std::vector<NodeIndex> skipped;
  std::vector<NodeIndex> to_process(graph_.get_dependents_view(idx).begin(),
                                    graph_.get_dependents_view(idx).end());

  while (!to_process.empty()) {
    NodeIndex current = to_process.back();
    to_process.pop_back();

    if (is_terminal(statuses_[current]) ||
        statuses_[current] == SubtaskStatus::Running) {
      continue;
    }

    set_status(current, SubtaskStatus::Skipped);
    skipped.push_back(current);

    for (NodeIndex downstream : graph_.get_dependents_view(current)) {
      to_process.push_back(downstream);
    }
  }
  return skipped;
}

auto GraphRun::ready() const -> std::vector<NodeIndex> {
  return {ready_.begin(), ready_.end()};
}

auto GraphRun::mark_started(NodeIndex idx) -> Result<void> {
  if (idx >= statuses_.size()) [[unlikely]] {
    return fail(Error::NotFound);
  }
  if (statuses_[idx] != SubtaskStatus::Ready) {
    return fail(Error::IllegalTransition);
  }
  for (NodeIndex dep : graph_.get_deps_view(idx)) {
    if (statuses_[dep] != SubtaskStatus::Succeeded) {
      return fail(Error::IllegalTransition);
    }
  }
  set_status(idx, SubtaskStatus::Running);
  return ok();
}

auto GraphRun::mark_succeeded(NodeIndex idx) -> Result<void> {
  if (idx >= statuses_.size()) [[unlikely]] {
    return fail(Error::NotFound);
  }
  if (statuses_[idx] != SubtaskStatus::Running) {
    return fail(Error::IllegalTransition);
  }
  set_status(idx, SubtaskStatus::Succeeded);
  unlock_dependents(idx);
  return ok();
}

auto GraphRun::requeue(NodeIndex idx) -> Result<void> {
  if (idx >= statuses_.size()) [[unlikely]] {
    return fail(Error::NotFound);
  }
  if (statuses_[idx] != SubtaskStatus::Running) {
    return fail(Error::IllegalTransition);
  }
  set_status(idx, SubtaskStatus::Ready);
  return ok();
}

auto GraphRun::mark_failed(NodeIndex idx) -> Result<std::vector<NodeIndex>> {
  if (idx >= statuses_.size()) [[unlikely]] {
    return fail(Error::NotFound);
  }
  if (statuses_[idx] != SubtaskStatus::Running &&
      statuses_[idx] != SubtaskStatus::Ready) {
    return fail(Error::IllegalTransition);
  }
  set_status(idx, SubtaskStatus::Failed);
  return skip_downstream(idx);
}

auto GraphRun::cancel() -> std::vector<NodeIndex> {
  std::vector<NodeIndex> skipped;
  for (NodeIndex i = 0; i < statuses_.size(); ++i) {
    if (statuses_[i] == SubtaskStatus::Pending ||
        statuses_[i] == SubtaskStatus::Ready) {
      set_status(i, SubtaskStatus::Skipped);
      skipped.push_back(i);
    }
  }
  return skipped;
}

auto GraphRun::status(NodeIndex idx) const -> SubtaskStatus {
  return statuses_.at(idx);
}

auto GraphRun::is_critical(NodeIndex idx) const -> bool {
  if (!graph_.get_dependents_view(idx).empty()) {
    return true;
  }
  return sink_count_ == 1;
}

auto GraphRun::is_complete() const noexcept -> bool {
  return count(SubtaskStatus::Pending) == 0 &&
         count(SubtaskStatus::Ready) == 0 &&
         count(SubtaskStatus::Running) == 0;
}

auto GraphRun::snapshot() const -> std::vector<Subtask> {
  std::vector<Subtask> result;
  result.reserve(graph_.size());
  for (NodeIndex i = 0; i < graph_.size(); ++i) {
    Subtask s = graph_.subtask(i);
    s.status = statuses_[i];
    result.push_back(std::move(s));
  }
  return result;
}

}  // namespace conductor
