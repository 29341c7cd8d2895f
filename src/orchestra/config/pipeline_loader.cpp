#include "orchestra/config/pipeline_loader.hpp"

#include "orchestra/config/yaml_utils.hpp"
#include "orchestra/util/log.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace orchestra {

using json = nlohmann::json;

namespace {

auto looks_like_json(std::string_view text) -> bool {
  auto it = std::ranges::find_if_not(
      text, [](unsigned char c) { return std::isspace(c) != 0; });
  return it != text.end() && *it == '{';
}

auto hoist_inline_components(json& doc) -> void {
  if (!doc.is_object() || !doc.contains("tasks") || !doc["tasks"].is_array()) {
    return;
  }
  auto& components = doc["components"];
  if (components.is_null()) {
    components = json::array();
  }
  for (auto& task : doc["tasks"]) {
    if (!task.is_object() || !task.contains("component") ||
        !task["component"].is_object()) {
      continue;
    }
    auto inline_spec = task["component"];
    auto name = inline_spec.value("name", std::string{});
    bool known = std::ranges::any_of(components, [&](const json& c) {
      return c.is_object() && c.value("name", std::string{}) == name;
    });
    if (!known) {
      components.push_back(inline_spec);
    }
    task["component"] = name;
  }
}

}  // namespace

auto PipelineLoader::load_from_file(std::string_view path)
    -> Result<PipelineSpec> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open pipeline file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (path.ends_with(".json")) {
    return load_from_json(buffer.str());
  }
  return load_from_string(buffer.str());
}

auto PipelineLoader::load_from_string(std::string_view text)
    -> Result<PipelineSpec> {
  if (looks_like_json(text)) {
    return load_from_json(text);
  }
  json doc;
  try {
    YAML::Node root = YAML::Load(std::string(text));
    if (!root.IsDefined() || !root.IsMap()) {
      log::error("Failed to parse pipeline YAML: expected a mapping");
      return fail(Error::ParseError);
    }
    doc = yaml_to_json(root);
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
  hoist_inline_components(doc);
  return parse_pipeline(doc);
}

auto PipelineLoader::load_from_json(std::string_view text)
    -> Result<PipelineSpec> {
  auto doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    log::error("Failed to parse pipeline JSON");
    return fail(Error::ParseError);
  }
  hoist_inline_components(doc);
  return parse_pipeline(doc);
}

auto parse_run_inputs(const std::vector<std::string>& pairs)
    -> Result<std::map<std::string, std::string>> {
  std::map<std::string, std::string> inputs;
  for (const auto& pair : pairs) {
    auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
      log::error("Invalid input '{}', expected name=value", pair);
      return fail(Error::InvalidArgument);
    }
    inputs[pair.substr(0, eq)] = pair.substr(eq + 1);
  }
  return inputs;
}

}  // namespace orchestra
