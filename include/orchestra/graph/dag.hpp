#pragma once

#include "orchestra/core/error.hpp"
#include "orchestra/util/id.hpp"

#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace orchestra {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Adjacency-list DAG over task ids. Edges point from producer to consumer.
class DAG {
public:
  auto add_node(TaskId task_id) -> NodeIndex;
  [[nodiscard]] auto add_edge(const TaskId& from, const TaskId& to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(const TaskId& task_id) const -> bool;
  [[nodiscard]] auto is_valid() const -> Result<void>;

  // Kahn order; ties broken by insertion order.
  [[nodiscard]] auto topological_order() const -> std::vector<NodeIndex>;

  [[nodiscard]] auto deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto index_of(const TaskId& task_id) const -> NodeIndex;
  [[nodiscard]] auto key(NodeIndex idx) const -> const TaskId&;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return nodes_.empty();
  }
  auto clear() -> void;

private:
  [[nodiscard]] auto would_create_cycle(NodeIndex from, NodeIndex to) const
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  std::unordered_map<TaskId, NodeIndex> key_to_idx_;
};

}  // namespace orchestra
