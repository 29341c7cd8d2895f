#pragma once

#include "orchestra/config/config.hpp"
#include "orchestra/core/error.hpp"
#include "orchestra/storage/run_state.hpp"

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace orchestra {

// Sole authority for run and task-execution state. Every task move is a
// compare-and-swap keyed by (run_id, task_id, expected status); implementations
// must be safe to call from several threads and several processes.
class StateStore {
public:
  virtual ~StateStore() = default;

  // Creates the run (Pending) and one Pending execution per task id.
  [[nodiscard]] virtual auto create_run(const NewRun& run) -> Result<RunId> = 0;

  [[nodiscard]] virtual auto get_run(const RunId& run_id)
      -> Result<RunRecord> = 0;
  [[nodiscard]] virtual auto get_run_state(const RunId& run_id)
      -> Result<RunState> = 0;

  // false when the current status differs from t.expected.
  [[nodiscard]] virtual auto transition_task(const RunId& run_id,
                                             const TaskId& task_id,
                                             const TaskTransition& t)
      -> Result<bool> = 0;

  [[nodiscard]] virtual auto record_task_output(const RunId& run_id,
                                                const TaskId& task_id,
                                                std::string_view port,
                                                const ArtifactData& artifact)
      -> Result<void> = 0;

  // Pending tasks whose backoff has elapsed. Dependency checks are left to
  // the readiness resolver.
  [[nodiscard]] virtual auto list_ready_candidates(const RunId& run_id,
                                                   Timestamp now)
      -> Result<std::vector<TaskId>>;

  // Sets started_at on entering Running and finished_at on terminal states.
  [[nodiscard]] virtual auto transition_run(const RunId& run_id,
                                            RunStatus expected, RunStatus next)
      -> Result<bool> = 0;

  // Durable cancel flag; false when the run is already terminal.
  [[nodiscard]] virtual auto request_cancel(const RunId& run_id)
      -> Result<bool> = 0;

  [[nodiscard]] virtual auto list_incomplete_runs()
      -> Result<std::vector<RunId>> = 0;

  [[nodiscard]] virtual auto list_attempts(const RunId& run_id,
                                           const TaskId& task_id)
      -> Result<std::vector<TaskAttempt>> = 0;

  // Most recent first.
  [[nodiscard]] virtual auto list_runs(std::size_t limit)
      -> Result<std::vector<RunRecord>> = 0;
};

[[nodiscard]] auto make_state_store(const StorageConfig& config)
    -> Result<std::unique_ptr<StateStore>>;

// Applies t to exec in memory. Used by engines that hold state directly.
auto apply_transition(TaskExecution& exec, const TaskTransition& t,
                      Timestamp now) -> void;

}  // namespace orchestra
