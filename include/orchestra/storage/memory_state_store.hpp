#pragma once

#include "orchestra/storage/state_store.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace orchestra {

// Mutex-guarded engine for tests and single-process runs. Nothing survives
// the process.
class MemoryStateStore final : public StateStore {
public:
  [[nodiscard]] auto create_run(const NewRun& run) -> Result<RunId> override;
  [[nodiscard]] auto get_run(const RunId& run_id) -> Result<RunRecord> override;
  [[nodiscard]] auto get_run_state(const RunId& run_id)
      -> Result<RunState> override;
  [[nodiscard]] auto transition_task(const RunId& run_id,
                                     const TaskId& task_id,
                                     const TaskTransition& t)
      -> Result<bool> override;
  [[nodiscard]] auto record_task_output(const RunId& run_id,
                                        const TaskId& task_id,
                                        std::string_view port,
                                        const ArtifactData& artifact)
      -> Result<void> override;
  [[nodiscard]] auto transition_run(const RunId& run_id, RunStatus expected,
                                    RunStatus next) -> Result<bool> override;
  [[nodiscard]] auto request_cancel(const RunId& run_id)
      -> Result<bool> override;
  [[nodiscard]] auto list_incomplete_runs()
      -> Result<std::vector<RunId>> override;
  [[nodiscard]] auto list_attempts(const RunId& run_id, const TaskId& task_id)
      -> Result<std::vector<TaskAttempt>> override;
  [[nodiscard]] auto list_runs(std::size_t limit)
      -> Result<std::vector<RunRecord>> override;

private:
  struct TaskEntry {
    TaskExecution exec;
    std::vector<TaskAttempt> attempts;
  };

  struct RunEntry {
    RunRecord record;
    std::vector<TaskEntry> tasks;
  };

  [[nodiscard]] auto find_task(const RunId& run_id, const TaskId& task_id)
      -> TaskEntry*;

  std::mutex mu_;
  std::unordered_map<RunId, RunEntry> runs_;
  std::vector<RunId> order_;
};

}  // namespace orchestra
