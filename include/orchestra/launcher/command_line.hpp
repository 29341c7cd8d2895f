#pragma once

#include "orchestra/core/error.hpp"
#include "orchestra/graph/component.hpp"

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace orchestra {

struct ResolvedCommand {
  std::vector<std::string> command;
  std::vector<std::string> args;

  // command followed by args.
  [[nodiscard]] auto argv() const -> std::vector<std::string>;
};

// Callbacks that turn a placeholder into text. They may stage files or add
// mounts as a side effect.
struct PlaceholderResolver {
  std::function<Result<std::string>(std::string_view)> input_value;
  std::function<Result<std::string>(std::string_view)> input_path;
  std::function<Result<std::string>(std::string_view)> output_path;
};

// Expands the container's command and args. Placeholders that name an input
// missing from provided_inputs are dropped from the command line.
[[nodiscard]] auto resolve_command_line(
    const ContainerSpec& container, const std::set<std::string>& provided_inputs,
    const PlaceholderResolver& resolver) -> Result<ResolvedCommand>;

}  // namespace orchestra
