#include "orchestra/cli/commands.hpp"
#include "orchestra/config/pipeline_loader.hpp"
#include "orchestra/graph/pipeline_graph.hpp"

#include <print>

namespace orchestra::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto spec = PipelineLoader::load_from_file(opts.pipeline_file);
  if (!spec) {
    std::println(stderr, "Error: Failed to load {}: {}", opts.pipeline_file,
                 spec.error().message());
    return 1;
  }

  auto report = PipelineGraph::validate(*spec);
  if (!report.ok()) {
    std::println("✗ {} - {}", spec->name, report.code.message());
    for (const auto& msg : report.messages) {
      std::println("    {}", msg);
    }
    return 1;
  }

  std::println("✓ {} - Valid ({} tasks, {} components)", spec->name,
               spec->tasks.size(), spec->components.size());
  return 0;
}

}  // namespace orchestra::cli
