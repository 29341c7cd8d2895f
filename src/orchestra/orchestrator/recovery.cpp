#include "orchestra/orchestrator/run_controller.hpp"

#include "orchestra/util/log.hpp"

namespace orchestra {

auto RunController::recover() -> Result<RecoveryReport> {
  RecoveryReport result;

  auto incomplete = store_.list_incomplete_runs();
  if (!incomplete) {
    log::error("Failed to list incomplete runs");
    return fail(incomplete.error());
  }
  log::info("Found {} incomplete runs to recover", incomplete->size());

  for (const auto& run_id : *incomplete) {
    auto state = store_.get_run_state(run_id);
    if (!state) {
      log::warn("Could not load run {}: {}", run_id, state.error().message());
      result.failed_runs.push_back(run_id);
      continue;
    }

    auto graph = graph_for(state->run);
    if (!graph) {
      log::warn("Could not rebuild pipeline for run {}, marking failed",
                run_id);
      if (auto r = store_.transition_run(run_id, state->run.status,
                                         RunStatus::Failed);
          !r) {
        log::warn("Failed to mark run {} failed: {}", run_id,
                  r.error().message());
      }
      result.failed_runs.push_back(run_id);
      continue;
    }

    // Running tasks are re-polled through their stored handles; a handle the
    // launcher no longer knows counts as a crashed attempt. Starting claims
    // past the claim timeout are released the same way.
    for (const auto& exec : state->tasks) {
      if (!is_in_flight(exec.status)) {
        continue;
      }
      auto idx = (*graph)->index_of(exec.task_id);
      if (idx == kInvalidNode) {
        continue;
      }
      auto outcome = dispatcher_.observe(**graph, *state, idx);
      if (!outcome) {
        log::warn("Failed to reconcile task {}/{}: {}", run_id, exec.task_id,
                  outcome.error().message());
        continue;
      }
      if (outcome->settled()) {
        log::info("Task {}/{} reconciled after restart: {}", run_id,
                  exec.task_id, to_string_view(outcome->status));
        ++result.reconciled_tasks;
      }
    }

    result.resumed_runs.push_back(run_id);
  }

  log::info("Recovery complete: {} runs resumed, {} failed, {} tasks reconciled",
            result.resumed_runs.size(), result.failed_runs.size(),
            result.reconciled_tasks);
  return result;
}

}  // namespace orchestra
