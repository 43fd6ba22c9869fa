#include "conductor/dag/dag.hpp"

#include <queue>

namespace conductor {

auto SubtaskGraph::add_node(Subtask subtask) -> NodeIndex {
  auto it = key_to_idx_.find(subtask.id);
  if (it != key_to_idx_.end()) {
    return it->second;
  }

  NodeIndex idx = static_cast<NodeIndex>(nodes_.size());
  key_to_idx_.emplace(subtask.id, idx);
  // Dependencies are owned by the edge list; add_edge rebuilds depends_on.
  subtask.depends_on.clear();
  nodes_.push_back(Node{std::move(subtask), {}, {}});
  return idx;
}

auto SubtaskGraph::add_edge(const SubtaskId& from, const SubtaskId& to)
    -> Result<void> {
  NodeIndex from_idx = get_index(from);
  NodeIndex to_idx = get_index(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound);
  }
  return add_edge(from_idx, to_idx);
}

auto SubtaskGraph::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size() || from == to) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }

  if (would_create_cycle(from, to)) {
    return fail(Error::CycleDetected);
  }

  nodes_[to].deps.push_back(from);
  nodes_[to].subtask.depends_on.push_back(nodes_[from].subtask.id);
  nodes_[from].dependents.push_back(to);
  return ok();
}

auto SubtaskGraph::from_subtasks(std::vector<Subtask> subtasks)
    -> Result<SubtaskGraph> {
  SubtaskGraph graph;
  std::vector<std::vector<SubtaskId>> deps;
  deps.reserve(subtasks.size());

  for (auto& s : subtasks) {
    if (graph.has_node(s.id)) {
      return fail(Error::AlreadyExists);
    }
    deps.push_back(s.depends_on);
    graph.add_node(std::move(s));
  }

  for (NodeIndex i = 0; i < deps.size(); ++i) {
    for (const auto& dep : deps[i]) {
      if (auto r = graph.add_edge(dep, graph.get_key(i)); !r) {
        return fail(r.error());
      }
    }
  }
  return graph;
}

auto SubtaskGraph::would_create_cycle(NodeIndex from, NodeIndex to) const
    -> bool {
  std::vector<bool> visited(nodes_.size(), false);
  std::vector<NodeIndex> stack;
  stack.push_back(from);

  while (!stack.empty()) {
    NodeIndex current = stack.back();
    stack.pop_back();

    if (current == to) {
      return true;
    }

    if (visited[current]) {
      continue;
    }
    visited[current] = true;

    for (NodeIndex dep : nodes_[current].deps) {
      if (!visited[dep]) {
        stack.push_back(dep);
      }
    }
  }
  return false;
}

auto SubtaskGraph::has_node(const SubtaskId& id) const -> bool {
  return key_to_idx_.contains(id);
}

auto SubtaskGraph::is_valid() const -> Result<void> {
  if (get_topological_order().size() != nodes_.size()) {
    return fail(Error::CycleDetected);
  }
  return ok();
}

auto SubtaskGraph::get_topological_order() const -> std::vector<NodeIndex> {
  std::vector<std::size_t> in_degree(nodes_.size());
  std::queue<NodeIndex> ready;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    in_degree[i] = nodes_[i].deps.size();
    if (in_degree[i] == 0) {
      ready.push(i);
    }
  }

  std::vector<NodeIndex> result;
  result.reserve(nodes_.size());
  while (!ready.empty()) {
    NodeIndex current = ready.front();
    ready.pop();
    result.push_back(current);

    for (NodeIndex dep : nodes_[current].dependents) {
      if (--in_degree[dep] == 0) {
        ready.push(dep);
      }
    }
  }

  return result;
}

auto SubtaskGraph::get_deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto SubtaskGraph::get_dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto SubtaskGraph::get_index(const SubtaskId& id) const -> NodeIndex {
  auto it = key_to_idx_.find(id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto SubtaskGraph::get_key(NodeIndex idx) const -> const SubtaskId& {
  return nodes_.at(idx).subtask.id;
}

auto SubtaskGraph::subtask(NodeIndex idx) const -> const Subtask& {
  return nodes_.at(idx).subtask;
}

auto SubtaskGraph::sinks() const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> result;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (nodes_[i].dependents.empty()) {
      result.push_back(i);
    }
  }
  return result;
}

auto SubtaskGraph::subtasks() const -> std::vector<Subtask> {
  std::vector<Subtask> result;
  result.reserve(nodes_.size());
  for (const auto& node : nodes_) {
    result.push_back(node.subtask);
  }
  return result;
}

}  // namespace conductor
