#include "orchestra/orchestrator/artifact_router.hpp"

#include "orchestra/util/hash.hpp"
#include "orchestra/util/log.hpp"
#include "orchestra/util/naming.hpp"

#include <filesystem>
#include <variant>

namespace orchestra {

using json = nlohmann::json;

namespace {

auto upstream_artifact(const TaskOutputArgument& ref, const RunState& state)
    -> Result<ArtifactData> {
  const auto* exec = state.find(ref.task_id);
  if (!exec || exec->status != TaskStatus::Succeeded) {
    log::error("Upstream task {} has not succeeded", ref.task_id);
    return fail(Error::UnresolvedReference);
  }
  auto it = exec->outputs.find(ref.output_name);
  if (it == exec->outputs.end()) {
    log::error("Upstream task {} recorded no output '{}'", ref.task_id,
               ref.output_name);
    return fail(Error::UnresolvedReference);
  }
  return it->second;
}

auto merge_into(json& target, const json& patch) -> void {
  if (!patch.is_object()) {
    return;
  }
  for (const auto& [key, value] : patch.items()) {
    if (value.is_object() && target.contains(key) && target[key].is_object()) {
      merge_into(target[key], value);
    } else {
      target[key] = value;
    }
  }
}

}  // namespace

ArtifactRouter::ArtifactRouter(std::string data_root, std::string logs_root)
    : data_root_(std::move(data_root)), logs_root_(std::move(logs_root)) {
}

auto ArtifactRouter::resolve_inputs(const PipelineGraph& graph, NodeIndex task,
                                    const RunState& state)
    -> Result<ResolvedInputs> {
  const auto& spec = graph.task(task);
  const auto& component = graph.component(task);
  ResolvedInputs inputs;

  for (const auto& input : component.inputs) {
    auto arg = spec.arguments.find(input.name);

    if (arg == spec.arguments.end()) {
      if (input.default_value) {
        inputs.emplace(input.name, ArtifactData{.value = input.default_value});
      } else if (!input.optional) {
        log::error("Task {}: required input '{}' has no argument", spec.id,
                   input.name);
        return fail(Error::UnresolvedReference);
      }
      continue;
    }

    const auto& source = arg->second;
    if (const auto* c = std::get_if<ConstantArgument>(&source)) {
      inputs.emplace(input.name, ArtifactData{.value = c->value});
    } else if (const auto* g = std::get_if<GraphInputArgument>(&source)) {
      if (auto it = state.run.inputs.find(g->input_name);
          it != state.run.inputs.end()) {
        inputs.emplace(input.name, ArtifactData{.value = it->second});
        continue;
      }
      const auto* declared = graph.find_input(g->input_name);
      if (declared && declared->default_value) {
        inputs.emplace(input.name,
                       ArtifactData{.value = declared->default_value});
      } else if (input.default_value) {
        inputs.emplace(input.name, ArtifactData{.value = input.default_value});
      } else if (!input.optional) {
        log::error("Task {}: pipeline input '{}' was not supplied", spec.id,
                   g->input_name);
        return fail(Error::UnresolvedReference);
      }
    } else if (const auto* t = std::get_if<TaskOutputArgument>(&source)) {
      auto artifact = upstream_artifact(*t, state);
      if (!artifact) {
        return fail(artifact.error());
      }
      inputs.emplace(input.name, std::move(*artifact));
    } else {
      const auto& collection = std::get<CollectionArgument>(source);
      std::vector<ArtifactData> items;
      items.reserve(collection.items.size());
      for (const auto& item : collection.items) {
        auto artifact = upstream_artifact(item, state);
        if (!artifact) {
          return fail(artifact.error());
        }
        items.push_back(std::move(*artifact));
      }
      inputs.emplace(input.name, std::move(items));
    }
  }

  return inputs;
}

auto ArtifactRouter::plan_outputs(const ComponentSpec& component,
                                  const ExecutionId& execution_id) const
    -> OutputPlan {
  namespace fs = std::filesystem;
  auto exec_name = util::sanitize_file_name(execution_id.str());
  auto exec_dir = fs::path(data_root_) / "by_execution" / exec_name;

  OutputPlan plan;
  for (const auto& output : component.outputs) {
    plan.output_uris.emplace(
        output.name, (exec_dir / "outputs" /
                      util::sanitize_file_name(output.name) / "data")
                         .string());
  }
  plan.log_uri =
      (fs::path(logs_root_) / "by_execution" / exec_name / "log.txt").string();
  plan.staging_dir = (exec_dir / "inputs").string();
  return plan;
}

auto ArtifactRouter::merge_annotations(const json& defaults, const json& run,
                                       const json& task) -> json {
  auto merged = json::object();
  merge_into(merged, defaults);
  merge_into(merged, run);
  merge_into(merged, task);
  return merged;
}

auto ArtifactRouter::cache_key(const ComponentSpec& component,
                               const ResolvedInputs& inputs) -> std::string {
  auto digests = json::object();
  for (const auto& [name, value] : inputs) {
    json j = std::holds_alternative<ArtifactData>(value)
                 ? json(std::get<ArtifactData>(value))
                 : json(std::get<std::vector<ArtifactData>>(value));
    digests[name] = util::sha256_hex(j.dump());
  }
  json key = {
      {"container_spec", component.container},
      {"input_hashes", std::move(digests)},
  };
  return util::sha256_hex(key.dump());
}

}  // namespace orchestra
