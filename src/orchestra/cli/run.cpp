#include "orchestra/app/orchestrator_service.hpp"
#include "orchestra/cli/commands.hpp"
#include "orchestra/config/pipeline_loader.hpp"
#include "orchestra/storage/state_strings.hpp"
#include "orchestra/util/daemon.hpp"
#include "orchestra/util/log.hpp"

#include <print>

namespace orchestra::cli {

auto cmd_run(const RunOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  if (opts.memory) {
    config->storage.engine = StorageEngine::Memory;
  }

  auto spec = PipelineLoader::load_from_file(opts.pipeline_file);
  if (!spec) {
    std::println(stderr, "Error: Failed to load {}: {}", opts.pipeline_file,
                 spec.error().message());
    return 1;
  }
  auto inputs = parse_run_inputs(opts.inputs);
  if (!inputs) {
    std::println(stderr, "Error: Invalid input, expected name=value");
    return 1;
  }

  if (!config->orchestrator.log_file.empty() &&
      !log::set_output_file(config->orchestrator.log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}",
                 config->orchestrator.log_file);
    return 1;
  }
  log::set_level(config->orchestrator.log_level);
  log::start();

  OrchestratorService service(std::move(*config));
  if (auto r = service.init(); !r.has_value()) {
    std::println(stderr, "Error: {}", r.error().message());
    log::stop();
    return 1;
  }

  orchestra::RunOptions run_opts;
  run_opts.inputs = std::move(*inputs);
  if (!opts.run_id.empty()) {
    run_opts.run_id = RunId{opts.run_id};
  }

  std::vector<std::string> messages;
  auto run_id = service.submit(*spec, std::move(run_opts), &messages);
  if (!run_id) {
    print_submit_error(run_id.error(), messages);
    log::stop();
    return 1;
  }
  std::println("Pipeline '{}' submitted, run_id: {}", spec->name, *run_id);

  if (!setup_signal_handlers()) {
    log::warn("Signal handlers unavailable, Ctrl-C will not cancel the run");
  }
  auto status = service.controller().drive(*run_id, shutdown_token());
  if (!status) {
    std::println(stderr, "Error: {}", status.error().message());
    log::stop();
    return 1;
  }

  if (auto state = service.store().get_run_state(*run_id)) {
    print_run_state(*state);
  }
  log::stop();

  std::println("Run {} finished: {}", *run_id, *status);
  return *status == RunStatus::Succeeded ? 0 : 1;
}

auto cmd_submit(const SubmitOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  auto spec = PipelineLoader::load_from_file(opts.pipeline_file);
  if (!spec) {
    std::println(stderr, "Error: Failed to load {}: {}", opts.pipeline_file,
                 spec.error().message());
    return 1;
  }
  auto inputs = parse_run_inputs(opts.inputs);
  if (!inputs) {
    std::println(stderr, "Error: Invalid input, expected name=value");
    return 1;
  }
  if (config->storage.engine == StorageEngine::Memory) {
    std::println(stderr,
                 "Error: submit needs a persistent store, the run would be "
                 "lost on exit");
    return 1;
  }

  log::set_level(config->orchestrator.log_level);

  OrchestratorService service(std::move(*config));
  orchestra::RunOptions run_opts;
  run_opts.inputs = std::move(*inputs);
  if (!opts.run_id.empty()) {
    run_opts.run_id = RunId{opts.run_id};
  }

  std::vector<std::string> messages;
  auto run_id = service.submit(*spec, std::move(run_opts), &messages);
  if (!run_id) {
    print_submit_error(run_id.error(), messages);
    return 1;
  }

  std::println("{}", *run_id);
  return 0;
}

}  // namespace orchestra::cli
