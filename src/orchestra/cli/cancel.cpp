#include "orchestra/cli/commands.hpp"
#include "orchestra/storage/state_store.hpp"
#include "orchestra/storage/state_strings.hpp"

#include <print>

namespace orchestra::cli {

auto cmd_cancel(const CancelOptions& opts) -> int {
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

  RunId run_id{opts.run_id};
  auto requested = (*store)->request_cancel(run_id);
  if (!requested) {
    std::println(stderr, "Error: {}: {}", opts.run_id,
                 requested.error().message());
    return 1;
  }
  if (!*requested) {
    auto run = (*store)->get_run(run_id);
    std::println("Run {} already finished ({})", opts.run_id,
                 run ? run_status_name(run->status) : "unknown");
    return 1;
  }

  std::println("Cancel requested for run {}", opts.run_id);
  return 0;
}

}  // namespace orchestra::cli
