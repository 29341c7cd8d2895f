#include "orchestra/graph/pipeline_graph.hpp"

#include "orchestra/util/log.hpp"
#include "orchestra/util/naming.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace orchestra {

namespace {

using ComponentIndex =
    std::unordered_map<std::string, std::size_t, StringHash, StringEqual>;

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

// "List<T>" collects values of type T.
auto element_type(std::string_view type) noexcept -> std::string_view {
  constexpr std::string_view kPrefix = "List<";
  if (type.size() > kPrefix.size() && type.back() == '>' &&
      iequals(type.substr(0, kPrefix.size()), kPrefix)) {
    return type.substr(kPrefix.size(), type.size() - kPrefix.size() - 1);
  }
  return type;
}

class Collector {
public:
  auto add(Error code, std::string message) -> void {
    if (report_.messages.empty()) {
      report_.code = make_error_code(code);
    }
    report_.messages.push_back(std::move(message));
  }

  [[nodiscard]] auto take() -> ValidationReport {
    return std::move(report_);
  }

private:
  ValidationReport report_;
};

auto check_component(const ComponentSpec& c, Collector& out) -> void {
  std::unordered_set<std::string_view> seen;
  for (const auto& in : c.inputs) {
    if (!seen.insert(in.name).second) {
      out.add(Error::AlreadyExists,
              std::format("Component '{}': duplicate input '{}'", c.name, in.name));
    }
  }
  seen.clear();
  std::unordered_map<std::string, std::string_view> stored_as;
  for (const auto& o : c.outputs) {
    if (!seen.insert(o.name).second) {
      out.add(Error::AlreadyExists,
              std::format("Component '{}': duplicate output '{}'", c.name, o.name));
      continue;
    }
    // Outputs are written under their sanitized name.
    auto [it, inserted] =
        stored_as.emplace(util::sanitize_file_name(o.name), o.name);
    if (!inserted) {
      out.add(Error::AlreadyExists,
              std::format("Component '{}': outputs '{}' and '{}' map to the "
                          "same storage name '{}'",
                          c.name, it->second, o.name, it->first));
    }
  }

  auto check_arg = [&](const CommandArgument& arg) {
    switch (arg.kind) {
      case PlaceholderKind::Literal:
        return;
      case PlaceholderKind::InputValue:
      case PlaceholderKind::InputPath:
        if (!c.find_input(arg.text)) {
          out.add(Error::DanglingReference,
                  std::format("Component '{}': placeholder names unknown input '{}'",
                              c.name, arg.text));
        }
        return;
      case PlaceholderKind::OutputPath:
        if (!c.find_output(arg.text)) {
          out.add(Error::DanglingReference,
                  std::format("Component '{}': placeholder names unknown output '{}'",
                              c.name, arg.text));
        }
        return;
    }
  };
  std::ranges::for_each(c.container.command, check_arg);
  std::ranges::for_each(c.container.args, check_arg);
}

auto build_dag(const PipelineSpec& spec, DAG& dag, Collector* out) -> void {
  for (const auto& task : spec.tasks) {
    dag.add_node(task.id);
  }
  for (const auto& task : spec.tasks) {
    NodeIndex to = dag.index_of(task.id);
    for (const auto& [input, source] : task.arguments) {
      for (const auto& ref : upstream_refs(source)) {
        NodeIndex from = dag.index_of(ref.task_id);
        if (from == kInvalidNode) {
          continue;  // reported as a dangling reference
        }
        if (auto r = dag.add_edge(from, to); !r && out) {
          out->add(Error::CycleDetected,
                   std::format("Task '{}': input '{}' from '{}' closes a cycle",
                               task.id, input, ref.task_id));
        }
      }
    }
  }
}

}  // namespace

auto types_compatible(std::string_view produced,
                      std::string_view consumed) noexcept -> bool {
  if (produced.empty() || consumed.empty()) {
    return true;
  }
  return iequals(produced, consumed);
}

auto PipelineGraph::validate(const PipelineSpec& spec) -> ValidationReport {
  Collector out;

  if (spec.name.empty()) {
    out.add(Error::InvalidArgument, "Pipeline name cannot be empty");
  }
  if (spec.tasks.empty()) {
    out.add(Error::InvalidArgument, "Pipeline must have at least one task");
  }

  ComponentIndex components;
  for (std::size_t i = 0; i < spec.components.size(); ++i) {
    const auto& c = spec.components[i];
    if (!components.emplace(c.name, i).second) {
      out.add(Error::AlreadyExists,
              std::format("Duplicate component name: '{}'", c.name));
    }
    check_component(c, out);
  }

  std::unordered_set<std::string_view> input_names;
  for (const auto& in : spec.inputs) {
    if (!input_names.insert(in.name).second) {
      out.add(Error::AlreadyExists,
              std::format("Duplicate pipeline input: '{}'", in.name));
    }
  }

  std::unordered_map<TaskId, const TaskSpec*> tasks;
  for (const auto& task : spec.tasks) {
    if (task.id.empty()) {
      out.add(Error::InvalidArgument, "Task ID cannot be empty");
      continue;
    }
    if (!tasks.emplace(task.id, &task).second) {
      out.add(Error::DuplicateTask,
              std::format("Duplicate task ID: '{}'", task.id));
    }
  }

  auto find_component = [&](std::string_view name) -> const ComponentSpec* {
    auto it = components.find(name);
    return it != components.end() ? &spec.components[it->second] : nullptr;
  };

  auto find_pipeline_input = [&](std::string_view name) -> const PipelineInput* {
    auto it = std::ranges::find(spec.inputs, name, &PipelineInput::name);
    return it != spec.inputs.end() ? &*it : nullptr;
  };

  // Resolves a reference to the producing output port, reporting problems.
  auto check_ref = [&](const TaskSpec& task, std::string_view input,
                       const TaskOutputArgument& ref) -> const OutputSpec* {
    auto it = tasks.find(ref.task_id);
    if (it == tasks.end()) {
      out.add(Error::DanglingReference,
              std::format("Task '{}': input '{}' references unknown task '{}'",
                          task.id, input, ref.task_id));
      return nullptr;
    }
    const auto* producer = find_component(it->second->component);
    if (!producer) {
      return nullptr;  // reported against the producer itself
    }
    const auto* port = producer->find_output(ref.output_name);
    if (!port) {
      out.add(Error::DanglingReference,
              std::format("Task '{}': input '{}' references unknown output '{}.{}'",
                          task.id, input, ref.task_id, ref.output_name));
    }
    return port;
  };

  for (const auto& task : spec.tasks) {
    const auto* component = find_component(task.component);
    if (!component) {
      out.add(Error::UnknownComponent,
              std::format("Task '{}': unknown component '{}'", task.id,
                          task.component));
      continue;
    }

    if (task.max_retries && *task.max_retries < 0) {
      out.add(Error::InvalidArgument,
              std::format("Task '{}': max_retries cannot be negative", task.id));
    }

    for (const auto& [input_name, source] : task.arguments) {
      const auto* input = component->find_input(input_name);
      if (!input) {
        out.add(Error::DanglingReference,
                std::format("Task '{}': component '{}' has no input '{}'",
                            task.id, component->name, input_name));
        continue;
      }

      if (const auto* g = std::get_if<GraphInputArgument>(&source)) {
        const auto* pin = find_pipeline_input(g->input_name);
        if (!pin) {
          out.add(Error::DanglingReference,
                  std::format("Task '{}': input '{}' references unknown pipeline input '{}'",
                              task.id, input_name, g->input_name));
        } else if (!types_compatible(pin->type, input->type)) {
          out.add(Error::TypeMismatch,
                  std::format("Task '{}': input '{}' expects '{}' but pipeline input '{}' is '{}'",
                              task.id, input_name, input->type, pin->name, pin->type));
        }
      } else if (const auto* t = std::get_if<TaskOutputArgument>(&source)) {
        if (const auto* port = check_ref(task, input_name, *t);
            port && !types_compatible(port->type, input->type)) {
          out.add(Error::TypeMismatch,
                  std::format("Task '{}': input '{}' expects '{}' but '{}.{}' is '{}'",
                              task.id, input_name, input->type, t->task_id,
                              t->output_name, port->type));
        }
      } else if (const auto* c = std::get_if<CollectionArgument>(&source)) {
        auto expected = element_type(input->type);
        for (const auto& item : c->items) {
          if (const auto* port = check_ref(task, input_name, item);
              port && !types_compatible(port->type, expected)) {
            out.add(Error::TypeMismatch,
                    std::format("Task '{}': collection input '{}' expects '{}' but '{}.{}' is '{}'",
                                task.id, input_name, expected, item.task_id,
                                item.output_name, port->type));
          }
        }
      }
    }

    for (const auto& input : component->inputs) {
      if (input.required() && !task.arguments.contains(input.name)) {
        out.add(Error::MissingArgument,
                std::format("Task '{}': required input '{}' has no argument",
                            task.id, input.name));
      }
    }
  }

  for (const auto& [name, ref] : spec.outputs) {
    auto it = tasks.find(ref.task_id);
    const auto* producer =
        it != tasks.end() ? find_component(it->second->component) : nullptr;
    if (!producer || !producer->find_output(ref.output_name)) {
      out.add(Error::DanglingReference,
              std::format("Pipeline output '{}' references unknown port '{}.{}'",
                          name, ref.task_id, ref.output_name));
    }
  }

  DAG dag;
  build_dag(spec, dag, &out);

  return out.take();
}

auto PipelineGraph::compile(PipelineSpec spec, std::vector<std::string>* messages)
    -> Result<std::shared_ptr<const PipelineGraph>> {
  auto report = validate(spec);
  if (!report.ok()) {
    for (const auto& m : report.messages) {
      log::debug("Pipeline '{}' rejected: {}", spec.name, m);
    }
    if (messages) {
      *messages = std::move(report.messages);
    }
    return fail(report.code);
  }

  auto graph = std::make_shared<PipelineGraph>(PrivateKey{});
  graph->spec_ = std::move(spec);
  build_dag(graph->spec_, graph->dag_, nullptr);

  graph->component_of_.reserve(graph->spec_.tasks.size());
  for (const auto& task : graph->spec_.tasks) {
    auto it = std::ranges::find(graph->spec_.components, task.component,
                                &ComponentSpec::name);
    graph->component_of_.push_back(
        static_cast<std::size_t>(it - graph->spec_.components.begin()));
  }

  log::debug("Compiled pipeline '{}' with {} tasks", graph->name(),
             graph->size());
  return graph;
}

auto PipelineGraph::find_input(std::string_view name) const
    -> const PipelineInput* {
  auto it = std::ranges::find(spec_.inputs, name, &PipelineInput::name);
  return it != spec_.inputs.end() ? &*it : nullptr;
}

}  // namespace orchestra
