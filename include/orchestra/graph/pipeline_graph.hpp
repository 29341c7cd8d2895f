#pragma once

#include "orchestra/core/error.hpp"
#include "orchestra/graph/dag.hpp"
#include "orchestra/graph/pipeline.hpp"

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace orchestra {

struct ValidationReport {
  std::error_code code;
  std::vector<std::string> messages;

  [[nodiscard]] auto ok() const noexcept -> bool {
    return messages.empty();
  }
};

// Validated, immutable view of a PipelineSpec. Node indices follow the
// declared task order.
class PipelineGraph {
  struct PrivateKey {
    explicit PrivateKey() = default;
  };

public:
  // Only compile() can name the key; use compile() to build a graph.
  explicit PipelineGraph(PrivateKey) {
  }

  [[nodiscard]] static auto validate(const PipelineSpec& spec)
      -> ValidationReport;

  [[nodiscard]] static auto compile(PipelineSpec spec,
                                    std::vector<std::string>* messages = nullptr)
      -> Result<std::shared_ptr<const PipelineGraph>>;

  [[nodiscard]] auto spec() const noexcept -> const PipelineSpec& {
    return spec_;
  }
  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return spec_.name;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return spec_.tasks.size();
  }
  [[nodiscard]] auto dag() const noexcept -> const DAG& {
    return dag_;
  }

  [[nodiscard]] auto task(NodeIndex idx) const -> const TaskSpec& {
    return spec_.tasks[idx];
  }
  [[nodiscard]] auto component(NodeIndex idx) const -> const ComponentSpec& {
    return spec_.components[component_of_[idx]];
  }
  [[nodiscard]] auto index_of(const TaskId& id) const -> NodeIndex {
    return dag_.index_of(id);
  }

  [[nodiscard]] auto upstream(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex> {
    return dag_.deps_view(idx);
  }
  [[nodiscard]] auto downstream(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex> {
    return dag_.dependents_view(idx);
  }
  [[nodiscard]] auto topological_order() const -> std::vector<NodeIndex> {
    return dag_.topological_order();
  }

  [[nodiscard]] auto find_input(std::string_view name) const
      -> const PipelineInput*;

private:
  PipelineSpec spec_;
  DAG dag_;
  std::vector<std::size_t> component_of_;
};

using PipelineGraphPtr = std::shared_ptr<const PipelineGraph>;

// Empty types are compatible with anything; otherwise names must match
// case-insensitively.
[[nodiscard]] auto types_compatible(std::string_view produced,
                                    std::string_view consumed) noexcept -> bool;

}  // namespace orchestra
