#include "orchestra/orchestrator/readiness.hpp"

#include <algorithm>

namespace orchestra {

namespace {

enum class RefState : std::uint8_t { Satisfied, Waiting, Dead };

auto check_ref(const TaskOutputArgument& ref, const PipelineGraph& graph,
               const std::vector<const TaskExecution*>& execs,
               const std::vector<bool>& skipped) -> RefState {
  auto up = graph.index_of(ref.task_id);
  if (up == kInvalidNode || !execs[up]) {
    return RefState::Dead;
  }
  if (skipped[up]) {
    return RefState::Dead;
  }
  const auto& exec = *execs[up];
  switch (exec.status) {
    case TaskStatus::Succeeded:
      // A success that never recorded the port cannot feed this input.
      return exec.outputs.contains(ref.output_name) ? RefState::Satisfied
                                                    : RefState::Dead;
    case TaskStatus::Failed:
    case TaskStatus::Cancelled:
    case TaskStatus::Skipped:
      return RefState::Dead;
    default:
      return RefState::Waiting;
  }
}

}  // namespace

auto ReadinessResolver::resolve(const PipelineGraph& graph,
                                const RunState& state, Timestamp now)
    -> ReadinessResult {
  ReadinessResult result;

  std::vector<const TaskExecution*> execs(graph.size(), nullptr);
  for (const auto& exec : state.tasks) {
    auto idx = graph.index_of(exec.task_id);
    if (idx != kInvalidNode) {
      execs[idx] = &exec;
    }
  }

  // Upstreams come before their consumers in topological order, so one pass
  // reaches the skip fixed point.
  std::vector<bool> skipped(graph.size(), false);
  for (auto idx : graph.topological_order()) {
    const auto* exec = execs[idx];
    if (!exec || exec->status != TaskStatus::Pending) {
      continue;
    }

    const auto& task = graph.task(idx);
    bool waiting = false;
    std::optional<TaskId> dead;
    for (const auto& [input, source] : task.arguments) {
      for (const auto& ref : upstream_refs(source)) {
        switch (check_ref(ref, graph, execs, skipped)) {
          case RefState::Satisfied:
            break;
          case RefState::Waiting:
            waiting = true;
            break;
          case RefState::Dead:
            if (!dead) {
              dead = ref.task_id;
            }
            break;
        }
      }
    }

    if (dead) {
      skipped[idx] = true;
      result.skip.push_back(SkipDecision{task.id, *dead});
      continue;
    }
    if (waiting) {
      continue;
    }

    if (exec->next_attempt_at && *exec->next_attempt_at > now) {
      result.deferred.push_back(task.id);
      if (!result.next_wakeup || *exec->next_attempt_at < *result.next_wakeup) {
        result.next_wakeup = *exec->next_attempt_at;
      }
      continue;
    }
    result.ready.push_back(task.id);
  }

  return result;
}

}  // namespace orchestra
