#include "orchestra/graph/dag.hpp"

#include <algorithm>
#include <queue>
#include <utility>

namespace orchestra {

namespace {

const TaskId kEmptyKey{};

}  // namespace

auto DAG::add_node(TaskId task_id) -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  if (it != key_to_idx_.end()) {
    return it->second;
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(task_id);
  key_to_idx_.emplace(std::move(task_id), idx);
  return idx;
}

auto DAG::add_edge(const TaskId& from, const TaskId& to) -> Result<void> {
  NodeIndex from_idx = index_of(from);
  NodeIndex to_idx = index_of(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound);
  }
  return add_edge(from_idx, to_idx);
}

auto DAG::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  if (from == to) {
    return fail(Error::CycleDetected);
  }

  // A consumer may reference several ports of the same producer.
  if (std::ranges::find(nodes_[to].deps, from) != nodes_[to].deps.end()) {
    return ok();
  }

  if (would_create_cycle(from, to)) {
    return fail(Error::CycleDetected);
  }

  nodes_[to].deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

// Adding from->to closes a cycle iff `to` already reaches `from`, i.e. `to`
// is an ancestor of `from`.
auto DAG::would_create_cycle(NodeIndex from, NodeIndex to) const -> bool {
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

auto DAG::has_node(const TaskId& task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

auto DAG::is_valid() const -> Result<void> {
  // 0 = unvisited, 1 = on stack, 2 = done
  std::vector<std::uint8_t> state(nodes_.size(), 0);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;

  for (NodeIndex start = 0; start < nodes_.size(); ++start) {
    if (state[start] != 0) {
      continue;
    }

    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto& [node, child_idx] = stack.back();
      const auto& next = nodes_[node].dependents;

      if (child_idx < next.size()) {
        NodeIndex child = next[child_idx++];
        if (state[child] == 1) {
          return fail(Error::CycleDetected);
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.emplace_back(child, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return ok();
}

auto DAG::topological_order() const -> std::vector<NodeIndex> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto& n : nodes_) {
    in_degree.push_back(n.deps.size());
  }

  std::queue<NodeIndex> ready;
  for (NodeIndex i = 0; i < in_degree.size(); ++i) {
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

auto DAG::deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto DAG::dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto DAG::index_of(const TaskId& task_id) const -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DAG::key(NodeIndex idx) const -> const TaskId& {
  if (idx >= keys_.size()) {
    return kEmptyKey;
  }
  return keys_[idx];
}

auto DAG::clear() -> void {
  nodes_.clear();
  keys_.clear();
  key_to_idx_.clear();
}

}  // namespace orchestra
