#pragma once

#include "orchestra/config/config.hpp"
#include "orchestra/graph/pipeline_graph.hpp"
#include "orchestra/launcher/launcher.hpp"
#include "orchestra/orchestrator/artifact_router.hpp"
#include "orchestra/storage/state_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace orchestra {

// Identifies one launched attempt of a task.
struct TaskExecutionHandle {
  RunId run_id;
  TaskId task_id;
  ExecutionId execution_id;
  int attempt{0};
  LaunchHandle launcher_handle;
};

enum class DispatchStatus : std::uint8_t {
  NoOp,        // lost a compare-and-swap, or nothing to do
  Launched,    // Pending -> Starting -> Running
  InFlight,    // still running at the launcher
  Succeeded,   // outputs recorded, Running -> Succeeded
  Retrying,    // back to Pending, retry_count incremented
  InfraRetry,  // back to Pending, infra_retry_count incremented
  Failed,      // terminal failure
  InfraError,  // launcher unreachable while polling; state untouched
};

[[nodiscard]] auto to_string_view(DispatchStatus s) noexcept
    -> std::string_view;

struct DispatchOutcome {
  DispatchStatus status{DispatchStatus::NoOp};
  TaskId task_id;
  std::optional<TaskExecutionHandle> handle;
  std::error_code error;

  // True when the task left the in-flight set.
  [[nodiscard]] auto settled() const noexcept -> bool {
    return status == DispatchStatus::Succeeded ||
           status == DispatchStatus::Retrying ||
           status == DispatchStatus::InfraRetry ||
           status == DispatchStatus::Failed;
  }
};

struct DispatchPolicy {
  RetryConfig retry;
  InfraRetryConfig infra_retry;
  // Starting claims older than this with no handle are treated as crashed.
  std::chrono::milliseconds claim_timeout{60000};
  nlohmann::json default_annotations = nlohmann::json::object();
};

// Claims tasks, launches them and folds launcher outcomes back into the
// store. Every write is a compare-and-swap keyed on the expected status, so
// concurrent dispatchers (threads or processes) never double-launch a task.
// Store I/O errors are returned; everything else is an outcome.
class Dispatcher {
public:
  Dispatcher(StateStore& store, ILauncher& launcher, const ArtifactRouter& router,
             DispatchPolicy policy);

  [[nodiscard]] auto dispatch(const PipelineGraph& graph, const RunState& state,
                              NodeIndex task) -> Result<DispatchOutcome>;

  // Polls a Running task, or reclaims a Starting task whose claim timed out.
  [[nodiscard]] auto observe(const PipelineGraph& graph, const RunState& state,
                             NodeIndex task) -> Result<DispatchOutcome>;

  // Forwards cancellation for an in-flight task and marks it Cancelled.
  [[nodiscard]] auto cancel(const TaskExecution& exec) -> Result<bool>;

private:
  // Retry-policy exit for a failed attempt.
  [[nodiscard]] auto fail_attempt(const TaskSpec& task,
                                  const TaskExecution& exec, TaskStatus from,
                                  std::optional<int> exit_code,
                                  std::string error) -> Result<DispatchOutcome>;
  [[nodiscard]] auto fail_infra(const TaskSpec& task, const TaskExecution& exec,
                                TaskStatus from, std::string error)
      -> Result<DispatchOutcome>;
  [[nodiscard]] auto fail_permanently(const TaskExecution& exec,
                                      TaskStatus from,
                                      std::optional<int> exit_code,
                                      std::string error)
      -> Result<DispatchOutcome>;

  StateStore& store_;
  ILauncher& launcher_;
  const ArtifactRouter& router_;
  DispatchPolicy policy_;
};

}  // namespace orchestra
