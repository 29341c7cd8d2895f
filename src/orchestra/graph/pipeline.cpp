#include "orchestra/graph/pipeline.hpp"

#include "orchestra/util/log.hpp"

#include <format>
#include <stdexcept>

namespace orchestra {

using json = nlohmann::json;

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

auto upstream_refs(const ArgumentSource& source)
    -> std::vector<TaskOutputArgument> {
  return std::visit(
      overloaded{
          [](const TaskOutputArgument& ref) {
            return std::vector<TaskOutputArgument>{ref};
          },
          [](const CollectionArgument& c) { return c.items; },
          [](const auto&) { return std::vector<TaskOutputArgument>{}; },
      },
      source);
}

auto to_json(json& j, const TaskOutputArgument& ref) -> void {
  j = json{{"task", ref.task_id.str()}, {"output", ref.output_name}};
}

auto from_json(const json& j, TaskOutputArgument& ref) -> void {
  ref.task_id = TaskId{j.at("task").get<std::string>()};
  ref.output_name = j.at("output").get<std::string>();
}

// Arguments are either a bare scalar (a constant) or a single-key object:
// {constant: v}, {graphInput: name}, {taskOutput: {task, output}},
// {collection: [{task, output}, ...]}.
auto to_json(json& j, const ArgumentSource& source) -> void {
  std::visit(overloaded{
                 [&](const ConstantArgument& c) { j = c.value; },
                 [&](const GraphInputArgument& g) {
                   j = json{{"graphInput", g.input_name}};
                 },
                 [&](const TaskOutputArgument& t) {
                   j = json{{"taskOutput", t}};
                 },
                 [&](const CollectionArgument& c) {
                   j = json{{"collection", c.items}};
                 },
             },
             source);
}

auto from_json(const json& j, ArgumentSource& source) -> void {
  if (!j.is_object()) {
    source = ConstantArgument{json_scalar_text(j)};
    return;
  }
  if (j.size() != 1) {
    throw std::invalid_argument(
        std::format("argument must have exactly one key: {}", j.dump()));
  }
  const auto& [key, value] = *j.items().begin();
  if (key == "constant") {
    source = ConstantArgument{json_scalar_text(value)};
  } else if (key == "graphInput") {
    source = GraphInputArgument{value.get<std::string>()};
  } else if (key == "taskOutput") {
    source = value.get<TaskOutputArgument>();
  } else if (key == "collection") {
    source = CollectionArgument{value.get<std::vector<TaskOutputArgument>>()};
  } else {
    throw std::invalid_argument(std::format("unknown argument kind '{}'", key));
  }
}

auto to_json(json& j, const TaskSpec& task) -> void {
  j = json{{"id", task.id.str()},
           {"component", task.component},
           {"arguments", task.arguments}};
  if (task.max_retries) {
    j["max_retries"] = *task.max_retries;
  }
  if (task.optional) {
    j["optional"] = true;
  }
  if (!task.annotations.empty()) {
    j["annotations"] = task.annotations;
  }
}

auto from_json(const json& j, TaskSpec& task) -> void {
  task.id = TaskId{j.at("id").get<std::string>()};
  task.component = j.at("component").get<std::string>();
  task.arguments.clear();
  if (j.contains("arguments")) {
    for (const auto& [name, value] : j["arguments"].items()) {
      task.arguments.emplace(name, value.get<ArgumentSource>());
    }
  }
  if (j.contains("max_retries")) {
    task.max_retries = j["max_retries"].get<int>();
  } else {
    task.max_retries.reset();
  }
  task.optional = j.value("optional", false);
  task.annotations = j.value("annotations", json::object());
}

auto to_json(json& j, const PipelineInput& input) -> void {
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

auto from_json(const json& j, PipelineInput& input) -> void {
  input.name = j.at("name").get<std::string>();
  input.type = j.contains("type") ? json_scalar_text(j["type"]) : "";
  if (j.contains("default") && !j["default"].is_null()) {
    input.default_value = json_scalar_text(j["default"]);
  } else {
    input.default_value.reset();
  }
  input.optional = j.value("optional", false);
}

auto to_json(json& j, const PipelineSpec& pipeline) -> void {
  j = json{{"name", pipeline.name},
           {"inputs", pipeline.inputs},
           {"components", pipeline.components},
           {"tasks", pipeline.tasks},
           {"outputs", pipeline.outputs}};
  if (!pipeline.description.empty()) {
    j["description"] = pipeline.description;
  }
  if (!pipeline.annotations.empty()) {
    j["annotations"] = pipeline.annotations;
  }
}

auto from_json(const json& j, PipelineSpec& pipeline) -> void {
  pipeline.name = j.at("name").get<std::string>();
  pipeline.description = j.value("description", std::string{});
  pipeline.inputs = j.value("inputs", std::vector<PipelineInput>{});
  pipeline.components = j.value("components", std::vector<ComponentSpec>{});
  pipeline.tasks = j.at("tasks").get<std::vector<TaskSpec>>();
  pipeline.outputs.clear();
  if (j.contains("outputs")) {
    for (const auto& [name, value] : j["outputs"].items()) {
      pipeline.outputs.emplace(name, value.get<TaskOutputArgument>());
    }
  }
  pipeline.annotations = j.value("annotations", json::object());
}

auto parse_pipeline(const json& j) -> Result<PipelineSpec> {
  try {
    return j.get<PipelineSpec>();
  } catch (const json::exception& e) {
    log::error("Malformed pipeline: {}", e.what());
  } catch (const std::invalid_argument& e) {
    log::error("Malformed pipeline: {}", e.what());
  }
  return fail(Error::ParseError);
}

auto parse_pipeline(std::string_view text) -> Result<PipelineSpec> {
  auto j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    log::error("Pipeline document is not valid JSON");
    return fail(Error::ParseError);
  }
  return parse_pipeline(j);
}

auto serialize_pipeline(const PipelineSpec& pipeline) -> std::string {
  return json(pipeline).dump();
}

}  // namespace orchestra
