#pragma once

#include "conductor/core/error.hpp"
#include "conductor/model/types.hpp"
#include "conductor/util/id.hpp"

#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace conductor {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Dependency graph of a task's subtasks. An edge from -> to means `to`
// depends on `from`. Edges that would close a cycle are rejected.
class SubtaskGraph {
public:
  auto add_node(Subtask subtask) -> NodeIndex;
  [[nodiscard]] auto add_edge(const SubtaskId& from, const SubtaskId& to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  // Builds a graph from subtasks whose depends_on lists name other members.
  [[nodiscard]] static auto from_subtasks(std::vector<Subtask> subtasks)
      -> Result<SubtaskGraph>;

  [[nodiscard]] auto has_node(const SubtaskId& id) const -> bool;
  [[nodiscard]] auto is_valid() const -> Result<void>;

  [[nodiscard]] auto get_topological_order() const -> std::vector<NodeIndex>;

  [[nodiscard]] auto get_deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto get_dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto get_index(const SubtaskId& id) const -> NodeIndex;
  [[nodiscard]] auto get_key(NodeIndex idx) const -> const SubtaskId&;
  [[nodiscard]] auto subtask(NodeIndex idx) const -> const Subtask&;

  [[nodiscard]] auto sinks() const -> std::vector<NodeIndex>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return nodes_.empty();
  }

  [[nodiscard]] auto subtasks() const -> std::vector<Subtask>;

private:
  [[nodiscard]] auto would_create_cycle(NodeIndex from, NodeIndex to) const
      -> bool;

  struct Node {
    Subtask subtask;
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::unordered_map<SubtaskId, NodeIndex> key_to_idx_;
};

}  // namespace conductor
