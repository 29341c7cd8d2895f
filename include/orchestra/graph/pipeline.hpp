#pragma once

#include "orchestra/core/error.hpp"
#include "orchestra/graph/component.hpp"
#include "orchestra/util/id.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace orchestra {

struct ConstantArgument {
  std::string value;
};

struct GraphInputArgument {
  std::string input_name;
};

struct TaskOutputArgument {
  TaskId task_id;
  std::string output_name;
};

// Fan-in; items are resolved in the order they are declared.
struct CollectionArgument {
  std::vector<TaskOutputArgument> items;
};

using ArgumentSource = std::variant<ConstantArgument, GraphInputArgument,
                                    TaskOutputArgument, CollectionArgument>;

// Every upstream port an argument reads from, in declared order.
[[nodiscard]] auto upstream_refs(const ArgumentSource& source)
    -> std::vector<TaskOutputArgument>;

struct TaskSpec {
  TaskId id;
  std::string component;
  std::map<std::string, ArgumentSource> arguments;
  std::optional<int> max_retries;
  bool optional{false};
  nlohmann::json annotations = nlohmann::json::object();
};

struct PipelineInput {
  std::string name;
  std::string type;
  std::optional<std::string> default_value;
  bool optional{false};
};

struct PipelineSpec {
  std::string name;
  std::string description;
  std::vector<PipelineInput> inputs;
  std::vector<ComponentSpec> components;
  std::vector<TaskSpec> tasks;
  std::map<std::string, TaskOutputArgument> outputs;
  nlohmann::json annotations = nlohmann::json::object();
};

auto to_json(nlohmann::json& j, const TaskOutputArgument& ref) -> void;
auto from_json(const nlohmann::json& j, TaskOutputArgument& ref) -> void;
auto to_json(nlohmann::json& j, const ArgumentSource& source) -> void;
auto from_json(const nlohmann::json& j, ArgumentSource& source) -> void;
auto to_json(nlohmann::json& j, const TaskSpec& task) -> void;
auto from_json(const nlohmann::json& j, TaskSpec& task) -> void;
auto to_json(nlohmann::json& j, const PipelineInput& input) -> void;
auto from_json(const nlohmann::json& j, PipelineInput& input) -> void;
auto to_json(nlohmann::json& j, const PipelineSpec& pipeline) -> void;
auto from_json(const nlohmann::json& j, PipelineSpec& pipeline) -> void;

// Exception-free entry points used at storage and loader boundaries.
[[nodiscard]] auto parse_pipeline(const nlohmann::json& j)
    -> Result<PipelineSpec>;
[[nodiscard]] auto parse_pipeline(std::string_view text)
    -> Result<PipelineSpec>;
[[nodiscard]] auto serialize_pipeline(const PipelineSpec& pipeline)
    -> std::string;

}  // namespace orchestra
