#pragma once

#include "orchestra/graph/pipeline_graph.hpp"
#include "orchestra/storage/run_state.hpp"

#include <optional>
#include <string>
#include <vector>

namespace orchestra {

struct SkipDecision {
  TaskId task_id;
  // First upstream task that can no longer supply an input.
  TaskId blocked_by;
};

struct ReadinessResult {
  // Pending tasks whose every upstream reference is satisfied.
  std::vector<TaskId> ready;
  // Pending tasks that can never become ready, computed transitively.
  std::vector<SkipDecision> skip;
  // Satisfied but still inside a retry backoff window.
  std::vector<TaskId> deferred;
  std::optional<Timestamp> next_wakeup;
};

// Pure function of the graph and one state snapshot; writes nothing.
class ReadinessResolver {
public:
  [[nodiscard]] static auto resolve(const PipelineGraph& graph,
                                    const RunState& state, Timestamp now)
      -> ReadinessResult;
};

}  // namespace orchestra
