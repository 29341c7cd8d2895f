#include "orchestra/app/orchestrator_service.hpp"
#include "orchestra/cli/commands.hpp"
#include "orchestra/util/daemon.hpp"
#include "orchestra/util/log.hpp"

#include <print>

namespace orchestra::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto result = load_config(opts.common);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);

  if (config.storage.engine == StorageEngine::Memory) {
    log::warn("Serving from the memory store, runs do not survive a restart");
  }

  const auto log_file = opts.log_file.value_or(config.orchestrator.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config.orchestrator.log_level);
  log::start();

  OrchestratorService service(std::move(config));
  if (auto r = service.init(); !r.has_value()) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  if (!setup_signal_handlers()) {
    log::error("Failed to install signal handlers");
    log::stop();
    return 1;
  }
  log::info("Orchestra starting (store: {})",
            service.config().storage.db_file);

  if (auto r = service.serve(shutdown_token()); !r.has_value()) {
    log::error("Serve failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  log::info("Orchestra stopped.");
  log::stop();
  return 0;
}

}  // namespace orchestra::cli
