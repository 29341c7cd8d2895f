#include "orchestra/app/orchestrator_service.hpp"

#include "orchestra/launcher/local_process_launcher.hpp"
#include "orchestra/util/log.hpp"

#include <algorithm>
#include <chrono>

namespace orchestra {

auto make_launcher(const LauncherConfig& config) -> std::unique_ptr<ILauncher> {
  log::info("Using {} launcher", to_string_view(config.mode));
  return std::make_unique<LocalProcessLauncher>(config);
}

OrchestratorService::OrchestratorService(Config config)
    : config_(std::move(config)) {
}

OrchestratorService::OrchestratorService(Config config,
                                         std::unique_ptr<StateStore> store,
                                         std::unique_ptr<ILauncher> launcher)
    : config_(std::move(config)),
      store_(std::move(store)),
      launcher_(std::move(launcher)) {
}

OrchestratorService::~OrchestratorService() {
  // The controller refers to the store and the launcher.
  controller_.reset();
  launcher_.reset();
  store_.reset();
}

auto OrchestratorService::init() -> Result<void> {
  if (controller_) {
    return ok();
  }
  if (!store_) {
    auto store = make_state_store(config_.storage);
    if (!store) {
      log::error("Failed to open state store: {}", store.error().message());
      return fail(store.error());
    }
    store_ = std::move(*store);
  }
  if (!launcher_) {
    launcher_ = make_launcher(config_.launcher);
  }
  controller_ = std::make_unique<RunController>(*store_, *launcher_, config_);
  return ok();
}

auto OrchestratorService::submit(const PipelineSpec& spec, RunOptions options,
                                 std::vector<std::string>* messages)
    -> Result<RunId> {
  if (auto r = init(); !r) {
    return fail(r.error());
  }
  return controller_->submit(spec, std::move(options), messages);
}

auto OrchestratorService::run(const PipelineSpec& spec, RunOptions options,
                              CancellationToken token) -> Result<RunId> {
  auto run_id = submit(spec, std::move(options));
  if (!run_id) {
    return fail(run_id.error());
  }
  auto status = controller_->drive(*run_id, token);
  if (!status) {
    return fail(status.error());
  }
  return run_id;
}

auto OrchestratorService::serve_once() -> Result<std::size_t> {
  if (auto r = init(); !r) {
    return fail(r.error());
  }
  auto runs = store_->list_incomplete_runs();
  if (!runs) {
    return fail(runs.error());
  }

  std::size_t progressed = 0;
  for (const auto& run_id : *runs) {
    auto report = controller_->step(run_id);
    if (!report) {
      log::warn("Run {}: iteration failed: {}", run_id,
                report.error().message());
      continue;
    }
    if (report->progressed() || report->terminal()) {
      ++progressed;
    }
  }
  return progressed;
}

auto OrchestratorService::serve(CancellationToken stop) -> Result<void> {
  if (auto r = init(); !r) {
    return fail(r.error());
  }
  if (auto r = controller_->recover(); !r) {
    log::warn("Recovery failed: {}", r.error().message());
  }

  stop.wake_on_cancel(controller_->notifier());
  log::info("Serving incomplete runs (poll interval {}ms)",
            config_.orchestrator.poll_interval.count());
  while (!stop.is_cancelled()) {
    auto progressed = serve_once();
    if (!progressed) {
      log::warn("Serve iteration failed: {}", progressed.error().message());
    } else if (*progressed > 0) {
      continue;
    }
    controller_->notifier()->wait_for(config_.orchestrator.poll_interval);
  }
  log::info("Serve loop stopped");
  return ok();
}

}  // namespace orchestra
