#pragma once

#include "orchestra/config/config.hpp"
#include "orchestra/core/cancellation.hpp"
#include "orchestra/graph/pipeline_graph.hpp"
#include "orchestra/launcher/launcher.hpp"
#include "orchestra/orchestrator/artifact_router.hpp"
#include "orchestra/orchestrator/concurrency_limiter.hpp"
#include "orchestra/orchestrator/dispatcher.hpp"
#include "orchestra/orchestrator/readiness.hpp"
#include "orchestra/storage/state_store.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace orchestra {

struct RunOptions {
  std::optional<RunId> run_id;
  std::map<std::string, std::string> inputs;
  nlohmann::json annotations = nlohmann::json::object();
};

// What one iteration of the driving loop did.
struct StepReport {
  RunStatus status{RunStatus::Pending};
  std::size_t dispatched{0};
  std::size_t settled{0};
  std::size_t skipped{0};
  std::size_t cancelled{0};
  std::size_t in_flight{0};
  std::size_t deferred{0};
  std::optional<Timestamp> next_wakeup;

  [[nodiscard]] auto terminal() const noexcept -> bool {
    return is_terminal(status);
  }
  [[nodiscard]] auto progressed() const noexcept -> bool {
    return dispatched + settled + skipped + cancelled > 0;
  }
};

struct RecoveryReport {
  std::vector<RunId> resumed_runs;
  std::vector<RunId> failed_runs;
  std::size_t reconciled_tasks{0};
};

// Top-level loop for pipeline runs. Holds no authoritative state: each step
// reads the run from the store, so any number of controllers, in this or
// other processes, may drive the same run.
class RunController {
public:
  RunController(StateStore& store, ILauncher& launcher, Config config,
                std::shared_ptr<ConcurrencyLimiter> limiter = nullptr);
  ~RunController();

  RunController(const RunController&) = delete;
  RunController& operator=(const RunController&) = delete;

  // Validates the pipeline and creates a run. Graph errors come back as
  // GraphValidationError codes; messages, when given, receives the details.
  [[nodiscard]] auto submit(const PipelineSpec& spec, RunOptions options = {},
                            std::vector<std::string>* messages = nullptr)
      -> Result<RunId>;

  // One iteration: observe in-flight tasks, apply skips and the failure
  // policy, dispatch ready tasks concurrently, settle the run status.
  [[nodiscard]] auto step(const RunId& run_id) -> Result<StepReport>;

  // Steps until the run is terminal. Cancelling the token wakes the loop,
  // requests a durable cancel and keeps stepping until it is applied.
  [[nodiscard]] auto drive(const RunId& run_id,
                           CancellationToken token = CancellationToken::none())
      -> Result<RunStatus>;

  [[nodiscard]] auto request_cancel(const RunId& run_id) -> Result<bool>;

  // Reconciles every incomplete run after a restart.
  [[nodiscard]] auto recover() -> Result<RecoveryReport>;

  [[nodiscard]] auto graph_for(const RunRecord& run) -> Result<PipelineGraphPtr>;

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }
  // Compiled graphs held for runs that are not yet terminal.
  [[nodiscard]] auto cached_graphs() const -> std::size_t;

  [[nodiscard]] auto notifier() const noexcept
      -> const std::shared_ptr<Notifier>& {
    return notifier_;
  }

private:
  [[nodiscard]] auto observe_in_flight(const PipelineGraph& graph,
                                       const RunState& state,
                                       StepReport& report) -> Result<void>;
  [[nodiscard]] auto apply_cancel(const RunState& state, StepReport& report)
      -> Result<void>;
  // Returns true when dispatching must stop for this run.
  [[nodiscard]] auto apply_failure_policy(const PipelineGraph& graph,
                                          const RunState& state,
                                          StepReport& report) -> Result<bool>;
  [[nodiscard]] auto apply_skips(const RunId& run_id,
                                 const std::vector<SkipDecision>& skips,
                                 StepReport& report) -> Result<void>;
  [[nodiscard]] auto dispatch_ready(const PipelineGraph& graph,
                                    const RunState& state,
                                    const std::vector<TaskId>& ready,
                                    StepReport& report) -> Result<void>;
  [[nodiscard]] auto settle(const PipelineGraph& graph, const RunState& state)
      -> Result<RunStatus>;
  // Drops per-run limiter usage and the cached graph of a finished run.
  auto release_run(const RunId& run_id) -> void;

  StateStore& store_;
  ILauncher& launcher_;
  Config config_;
  ArtifactRouter router_;
  Dispatcher dispatcher_;
  std::shared_ptr<ConcurrencyLimiter> limiter_;
  std::shared_ptr<Notifier> notifier_;

  mutable std::mutex graphs_mu_;
  // Compiled from the stored spec; a cache, never consulted for state.
  std::unordered_map<RunId, PipelineGraphPtr> graphs_;
};

// True when a failed task should fail its run.
[[nodiscard]] auto is_hard_failure(const PipelineGraph& graph,
                                   const TaskExecution& exec) -> bool;

}  // namespace orchestra
