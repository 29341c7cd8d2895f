#include "orchestra/cli/commands.hpp"
#include "orchestra/storage/state_store.hpp"
#include "orchestra/storage/state_strings.hpp"

#include <chrono>
#include <format>
#include <print>

namespace orchestra::cli {

namespace {

auto format_time(const std::optional<Timestamp>& tp) -> std::string {
  if (!tp) {
    return "-";
  }
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(*tp));
}

}  // namespace

auto print_run_state(const RunState& state) -> void {
  const auto& run = state.run;
  std::println("Run:      {}", run.id);
  std::println("Pipeline: {}", run.pipeline_name);
  std::println("Status:   {}{}", run.status,
               run.cancel_requested && !is_terminal(run.status)
                   ? " (cancel requested)"
                   : "");
  std::println("Created:  {}", format_time(run.created_at));
  if (run.started_at) {
    std::println("Started:  {}", format_time(run.started_at));
  }
  if (run.finished_at) {
    std::println("Finished: {}", format_time(run.finished_at));
    if (run.started_at) {
      auto secs = std::chrono::duration_cast<std::chrono::seconds>(
          *run.finished_at - *run.started_at);
      std::println("Duration: {}s", secs.count());
    }
  }

  std::println("");
  std::println("{:<24} {:<10} {:>7} {:>5} {}", "TASK", "STATUS", "ATTEMPT",
               "EXIT", "ERROR");
  for (const auto& task : state.tasks) {
    std::println("{:<24} {:<10} {:>7} {:>5} {}", task.task_id, task.status,
                 task.attempt,
                 task.exit_code ? std::to_string(*task.exit_code) : "-",
                 task.error_message);
    for (const auto& [port, artifact] : task.outputs) {
      if (artifact.value) {
        std::println("    {} = {}", port, *artifact.value);
      } else if (artifact.uri) {
        std::println("    {} -> {}", port, *artifact.uri);
      }
    }
  }
}

auto cmd_status(const StatusOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  auto store = make_state_store(config->storage);
  if (!store) {
    std::println(stderr, "Error: Failed to open state store: {}",
                 store.error().message());
    return 1;
  }

  if (!opts.run_id.empty()) {
    auto state = (*store)->get_run_state(RunId{opts.run_id});
    if (!state) {
      std::println(stderr, "Error: Run not found: {}", opts.run_id);
      return 1;
    }
    print_run_state(*state);
    return 0;
  }

  auto runs = (*store)->list_runs(20);
  if (!runs) {
    std::println(stderr, "Error: {}", runs.error().message());
    return 1;
  }
  if (runs->empty()) {
    std::println("No runs found.");
    return 0;
  }

  std::println("{:<22} {:<20} {:<10} {:<20}", "RUN_ID", "PIPELINE", "STATUS",
               "CREATED");
  for (const auto& run : *runs) {
    std::println("{:<22} {:<20} {:<10} {:<20}", run.id, run.pipeline_name,
                 run.status, format_time(run.created_at));
  }
  return 0;
}

}  // namespace orchestra::cli
