#include "orchestra/cli/commands.hpp"

#include <print>

namespace orchestra::cli {

auto load_config(const CommonOptions& opts) -> Result<Config> {
  Config config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return fail(loaded.error());
    }
    config = std::move(*loaded);
  }
  if (!opts.db_file.empty()) {
    config.storage.db_file = opts.db_file;
  }
  return config;
}

auto print_submit_error(std::error_code ec,
                        const std::vector<std::string>& messages) -> void {
  // Structural problems such as an empty task list carry InvalidArgument
  // but still come with validation messages.
  if (!is_graph_validation_error(ec) && messages.empty()) {
    std::println(stderr, "Error: Failed to create run: {}", ec.message());
    return;
  }
  std::println(stderr, "Error: Pipeline rejected: {}", ec.message());
  for (const auto& msg : messages) {
    std::println(stderr, "  {}", msg);
  }
}

}  // namespace orchestra::cli
