#include "orchestra/graph/component.hpp"

#include "orchestra/util/hash.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace orchestra {

using json = nlohmann::json;

auto ComponentSpec::find_input(std::string_view input) const
    -> const InputSpec* {
  auto it = std::ranges::find(inputs, input, &InputSpec::name);
  return it != inputs.end() ? &*it : nullptr;
}

auto ComponentSpec::find_output(std::string_view output) const
    -> const OutputSpec* {
  auto it = std::ranges::find(outputs, output, &OutputSpec::name);
  return it != outputs.end() ? &*it : nullptr;
}

auto ComponentSpec::digest() const -> std::string {
  return util::sha256_hex(json(*this).dump());
}

auto ComponentSpec::identity() const -> std::string {
  if (!version.empty()) {
    return std::format("{}@{}", name, version);
  }
  return digest();
}

auto json_scalar_text(const json& j) -> std::string {
  if (j.is_string()) {
    return j.get<std::string>();
  }
  return j.dump();
}

auto to_json(json& j, const CommandArgument& arg) -> void {
  switch (arg.kind) {
    case PlaceholderKind::Literal:
      j = arg.text;
      break;
    case PlaceholderKind::InputValue:
      j = json{{"inputValue", arg.text}};
      break;
    case PlaceholderKind::InputPath:
      j = json{{"inputPath", arg.text}};
      break;
    case PlaceholderKind::OutputPath:
      j = json{{"outputPath", arg.text}};
      break;
  }
}

auto from_json(const json& j, CommandArgument& arg) -> void {
  if (!j.is_object()) {
    arg = CommandArgument::literal(json_scalar_text(j));
    return;
  }
  if (j.size() != 1) {
    throw std::invalid_argument(
        std::format("placeholder must have exactly one key: {}", j.dump()));
  }
  const auto& [key, value] = *j.items().begin();
  auto port = value.get<std::string>();
  if (key == "inputValue") {
    arg = CommandArgument::input_value(std::move(port));
  } else if (key == "inputPath") {
    arg = CommandArgument::input_path(std::move(port));
  } else if (key == "outputPath") {
    arg = CommandArgument::output_path(std::move(port));
  } else {
    throw std::invalid_argument(std::format("unknown placeholder '{}'", key));
  }
}

auto to_json(json& j, const InputSpec& input) -> void {
  j = json{{"name", input.name}};
  if (!input.type.empty()) {
    j["type"] = input.type;
  }
  if (input.default_value) {
    j["default"] = *input.default_value;
  }
  if (input.optional) {
    j["optional"] = true;
  }
}

auto from_json(const json& j, InputSpec& input) -> void {
  input.name = j.at("name").get<std::string>();
  input.type = j.contains("type") ? json_scalar_text(j["type"]) : "";
  if (j.contains("default") && !j["default"].is_null()) {
    input.default_value = json_scalar_text(j["default"]);
  } else {
    input.default_value.reset();
  }
  input.optional = j.value("optional", false);
}

auto to_json(json& j, const OutputSpec& output) -> void {
  j = json{{"name", output.name}};
  if (!output.type.empty()) {
    j["type"] = output.type;
  }
}

auto from_json(const json& j, OutputSpec& output) -> void {
  output.name = j.at("name").get<std::string>();
  output.type = j.contains("type") ? json_scalar_text(j["type"]) : "";
}

auto to_json(json& j, const ContainerSpec& container) -> void {
  j = json{{"image", container.image},
           {"command", container.command},
           {"args", container.args}};
  if (!container.env.empty()) {
    j["env"] = container.env;
  }
}

auto from_json(const json& j, ContainerSpec& container) -> void {
  container.image = j.at("image").get<std::string>();
  container.command = j.value("command", std::vector<CommandArgument>{});
  container.args = j.value("args", std::vector<CommandArgument>{});
  container.env.clear();
  if (j.contains("env")) {
    for (const auto& [key, value] : j["env"].items()) {
      container.env.emplace(key, json_scalar_text(value));
    }
  }
}

auto to_json(json& j, const ComponentSpec& component) -> void {
  j = json{{"name", component.name},
           {"inputs", component.inputs},
           {"outputs", component.outputs},
           {"implementation", {{"container", component.container}}}};
  if (!component.version.empty()) {
    j["version"] = component.version;
  }
  if (!component.description.empty()) {
    j["description"] = component.description;
  }
}

auto from_json(const json& j, ComponentSpec& component) -> void {
  component.name = j.at("name").get<std::string>();
  component.version = j.contains("version") ? json_scalar_text(j["version"]) : "";
  component.description = j.value("description", std::string{});
  component.inputs = j.value("inputs", std::vector<InputSpec>{});
  component.outputs = j.value("outputs", std::vector<OutputSpec>{});
  component.container =
      j.at("implementation").at("container").get<ContainerSpec>();
}

}  // namespace orchestra
