#pragma once

#include "orchestra/core/error.hpp"
#include "orchestra/graph/pipeline_graph.hpp"
#include "orchestra/storage/run_state.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace orchestra {

// Where one attempt writes its outputs and log.
struct OutputPlan {
  std::map<std::string, std::string> output_uris;
  std::string log_uri;
  std::string staging_dir;
};

// Maps upstream outputs, constants and run inputs onto a task's input ports,
// and lays out where an attempt's outputs go.
class ArtifactRouter {
public:
  ArtifactRouter(std::string data_root, std::string logs_root);

  // Fails with Error::UnresolvedReference when a bound upstream output is not
  // recorded yet or a required input has no source.
  [[nodiscard]] static auto resolve_inputs(const PipelineGraph& graph,
                                           NodeIndex task,
                                           const RunState& state)
      -> Result<ResolvedInputs>;

  // <data_root>/by_execution/<id>/outputs/<name>/data per output, and
  // <logs_root>/by_execution/<id>/log.txt for the log.
  [[nodiscard]] auto plan_outputs(const ComponentSpec& component,
                                  const ExecutionId& execution_id) const
      -> OutputPlan;

  // Recursive merge; later maps win on conflicting keys.
  [[nodiscard]] static auto merge_annotations(const nlohmann::json& defaults,
                                              const nlohmann::json& run,
                                              const nlohmann::json& task)
      -> nlohmann::json;

  // SHA-256 over the container spec and the digests of the resolved inputs.
  [[nodiscard]] static auto cache_key(const ComponentSpec& component,
                                      const ResolvedInputs& inputs)
      -> std::string;

  [[nodiscard]] auto data_root() const noexcept -> const std::string& {
    return data_root_;
  }
  [[nodiscard]] auto logs_root() const noexcept -> const std::string& {
    return logs_root_;
  }

private:
  std::string data_root_;
  std::string logs_root_;
};

}  // namespace orchestra
