#include "orchestra/launcher/command_line.hpp"

#include "orchestra/util/log.hpp"

namespace orchestra {

auto ResolvedCommand::argv() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(command.size() + args.size());
  out.insert(out.end(), command.begin(), command.end());
  out.insert(out.end(), args.begin(), args.end());
  return out;
}

namespace {

auto expand(const std::vector<CommandArgument>& items,
            const std::set<std::string>& provided_inputs,
            const PlaceholderResolver& resolver, std::vector<std::string>& out)
    -> Result<void> {
  for (const auto& item : items) {
    Result<std::string> text;
    switch (item.kind) {
      case PlaceholderKind::Literal:
        text = item.text;
        break;
      case PlaceholderKind::InputValue:
        if (!provided_inputs.contains(item.text)) {
          continue;
        }
        text = resolver.input_value(item.text);
        break;
      case PlaceholderKind::InputPath:
        if (!provided_inputs.contains(item.text)) {
          continue;
        }
        text = resolver.input_path(item.text);
        break;
      case PlaceholderKind::OutputPath:
        text = resolver.output_path(item.text);
        break;
    }
    if (!text) {
      log::debug("Failed to resolve placeholder '{}': {}", item.text,
                 text.error().message());
      return fail(text.error());
    }
    out.push_back(std::move(*text));
  }
  return ok();
}

}  // namespace

auto resolve_command_line(const ContainerSpec& container,
                          const std::set<std::string>& provided_inputs,
                          const PlaceholderResolver& resolver)
    -> Result<ResolvedCommand> {
  ResolvedCommand resolved;
  if (auto r = expand(container.command, provided_inputs, resolver,
                      resolved.command);
      !r) {
    return fail(r.error());
  }
  if (auto r =
          expand(container.args, provided_inputs, resolver, resolved.args);
      !r) {
    return fail(r.error());
  }
  return resolved;
}

}  // namespace orchestra
