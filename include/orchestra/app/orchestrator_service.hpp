#pragma once

#include "orchestra/config/config.hpp"
#include "orchestra/core/cancellation.hpp"
#include "orchestra/core/error.hpp"
#include "orchestra/launcher/launcher.hpp"
#include "orchestra/orchestrator/run_controller.hpp"
#include "orchestra/storage/state_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace orchestra {

// Facade that wires the store, the launcher and a run controller from one
// Config.
class OrchestratorService {
public:
  explicit OrchestratorService(Config config);
  // Uses the given engines instead of building them from the config.
  OrchestratorService(Config config, std::unique_ptr<StateStore> store,
                      std::unique_ptr<ILauncher> launcher);
  ~OrchestratorService();

  OrchestratorService(const OrchestratorService&) = delete;
  auto operator=(const OrchestratorService&) -> OrchestratorService& = delete;

  [[nodiscard]] auto init() -> Result<void>;

  [[nodiscard]] auto submit(const PipelineSpec& spec, RunOptions options = {},
                            std::vector<std::string>* messages = nullptr)
      -> Result<RunId>;

  // Submits and drives the run to a terminal status.
  [[nodiscard]] auto run(const PipelineSpec& spec, RunOptions options = {},
                         CancellationToken token = CancellationToken::none())
      -> Result<RunId>;

  // Recovers, then steps every incomplete run (including runs submitted by
  // other processes) until stop is cancelled.
  [[nodiscard]] auto serve(CancellationToken stop) -> Result<void>;

  // One pass over the incomplete runs. Returns how many made progress.
  [[nodiscard]] auto serve_once() -> Result<std::size_t>;

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }
  [[nodiscard]] auto store() noexcept -> StateStore& {
    return *store_;
  }
  [[nodiscard]] auto launcher() noexcept -> ILauncher& {
    return *launcher_;
  }
  [[nodiscard]] auto controller() noexcept -> RunController& {
    return *controller_;
  }

private:
  Config config_;
  std::unique_ptr<StateStore> store_;
  std::unique_ptr<ILauncher> launcher_;
  std::unique_ptr<RunController> controller_;
};

[[nodiscard]] auto make_launcher(const LauncherConfig& config)
    -> std::unique_ptr<ILauncher>;

}  // namespace orchestra
