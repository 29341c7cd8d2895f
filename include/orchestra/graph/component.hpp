#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orchestra {

struct InputSpec {
  std::string name;
  std::string type;
  std::optional<std::string> default_value;
  bool optional{false};

  [[nodiscard]] auto required() const noexcept -> bool {
    return !optional && !default_value.has_value();
  }
};

struct OutputSpec {
  std::string name;
  std::string type;
};

enum class PlaceholderKind : std::uint8_t {
  Literal,
  InputValue,
  InputPath,
  OutputPath,
};

// One command-line element: a literal string, or a placeholder naming a port.
struct CommandArgument {
  PlaceholderKind kind{PlaceholderKind::Literal};
  std::string text;

  [[nodiscard]] static auto literal(std::string s) -> CommandArgument {
    return {PlaceholderKind::Literal, std::move(s)};
  }
  [[nodiscard]] static auto input_value(std::string name) -> CommandArgument {
    return {PlaceholderKind::InputValue, std::move(name)};
  }
  [[nodiscard]] static auto input_path(std::string name) -> CommandArgument {
    return {PlaceholderKind::InputPath, std::move(name)};
  }
  [[nodiscard]] static auto output_path(std::string name) -> CommandArgument {
    return {PlaceholderKind::OutputPath, std::move(name)};
  }

  auto operator==(const CommandArgument&) const -> bool = default;
};

struct ContainerSpec {
  std::string image;
  std::vector<CommandArgument> command;
  std::vector<CommandArgument> args;
  std::map<std::string, std::string> env;
};

// Immutable interface + implementation of a containerized program.
struct ComponentSpec {
  std::string name;
  std::string version;
  std::string description;
  std::vector<InputSpec> inputs;
  std::vector<OutputSpec> outputs;
  ContainerSpec container;

  [[nodiscard]] auto find_input(std::string_view input) const
      -> const InputSpec*;
  [[nodiscard]] auto find_output(std::string_view output) const
      -> const OutputSpec*;

  // SHA-256 of the canonical JSON form.
  [[nodiscard]] auto digest() const -> std::string;

  // name@version when versioned, otherwise the digest.
  [[nodiscard]] auto identity() const -> std::string;
};

// Canonical JSON (sorted keys, camelCase placeholders). from_json throws
// nlohmann::json::exception or std::invalid_argument on malformed input.
auto to_json(nlohmann::json& j, const CommandArgument& arg) -> void;
auto from_json(const nlohmann::json& j, CommandArgument& arg) -> void;
auto to_json(nlohmann::json& j, const InputSpec& input) -> void;
auto from_json(const nlohmann::json& j, InputSpec& input) -> void;
auto to_json(nlohmann::json& j, const OutputSpec& output) -> void;
auto from_json(const nlohmann::json& j, OutputSpec& output) -> void;
auto to_json(nlohmann::json& j, const ContainerSpec& container) -> void;
auto from_json(const nlohmann::json& j, ContainerSpec& container) -> void;
auto to_json(nlohmann::json& j, const ComponentSpec& component) -> void;
auto from_json(const nlohmann::json& j, ComponentSpec& component) -> void;

// Scalars are kept verbatim when they are strings and dumped otherwise.
[[nodiscard]] auto json_scalar_text(const nlohmann::json& j) -> std::string;

}  // namespace orchestra
