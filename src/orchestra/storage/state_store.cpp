#include "orchestra/storage/state_store.hpp"

#include "orchestra/storage/memory_state_store.hpp"
#include "orchestra/storage/sqlite_state_store.hpp"
#include "orchestra/util/log.hpp"

#include <algorithm>

namespace orchestra {

using json = nlohmann::json;

auto to_json(json& j, const ArtifactData& a) -> void {
  j = json::object();
  if (a.value) {
    j["value"] = *a.value;
  }
  if (a.uri) {
    j["uri"] = *a.uri;
  }
}

auto from_json(const json& j, ArtifactData& a) -> void {
  a.value.reset();
  a.uri.reset();
  if (j.contains("value") && j["value"].is_string()) {
    a.value = j["value"].get<std::string>();
  }
  if (j.contains("uri") && j["uri"].is_string()) {
    a.uri = j["uri"].get<std::string>();
  }
}

auto inputs_to_json(const ResolvedInputs& inputs) -> json {
  auto j = json::object();
  for (const auto& [name, value] : inputs) {
    if (const auto* single = std::get_if<ArtifactData>(&value)) {
      j[name] = *single;
    } else {
      j[name] = std::get<std::vector<ArtifactData>>(value);
    }
  }
  return j;
}

auto inputs_from_json(const json& j) -> ResolvedInputs {
  ResolvedInputs inputs;
  if (!j.is_object()) {
    return inputs;
  }
  for (const auto& [name, value] : j.items()) {
    if (value.is_array()) {
      inputs.emplace(name, value.get<std::vector<ArtifactData>>());
    } else {
      inputs.emplace(name, value.get<ArtifactData>());
    }
  }
  return inputs;
}

auto RunState::find(const TaskId& id) const -> const TaskExecution* {
  auto it = std::ranges::find(tasks, id, &TaskExecution::task_id);
  return it != tasks.end() ? &*it : nullptr;
}

auto RunState::count(TaskStatus s) const -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count(tasks, s, &TaskExecution::status));
}

auto RunState::in_flight() const -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count_if(
      tasks, [](const TaskExecution& t) { return is_in_flight(t.status); }));
}

auto StateStore::list_ready_candidates(const RunId& run_id, Timestamp now)
    -> Result<std::vector<TaskId>> {
  auto state = get_run_state(run_id);
  if (!state) {
    return fail(state.error());
  }
  std::vector<TaskId> ids;
  for (const auto& t : state->tasks) {
    if (t.status == TaskStatus::Pending &&
        (!t.next_attempt_at || *t.next_attempt_at <= now)) {
      ids.push_back(t.task_id);
    }
  }
  return ids;
}

auto apply_transition(TaskExecution& exec, const TaskTransition& t,
                      Timestamp now) -> void {
  exec.status = t.next;
  if (t.attempt) exec.attempt = *t.attempt;
  if (t.retry_count) exec.retry_count = *t.retry_count;
  if (t.infra_retry_count) exec.infra_retry_count = *t.infra_retry_count;
  if (t.execution_id) exec.execution_id = *t.execution_id;
  if (t.launcher_handle) exec.launcher_handle = *t.launcher_handle;
  if (t.inputs) exec.inputs = *t.inputs;
  if (t.cache_key) exec.cache_key = *t.cache_key;
  if (t.next_attempt_at) exec.next_attempt_at = *t.next_attempt_at;

  if (t.next == TaskStatus::Starting) {
    exec.exit_code.reset();
    exec.error_message.clear();
    exec.started_at = now;
    exec.finished_at.reset();
  }
  if (t.exit_code) exec.exit_code = *t.exit_code;
  if (t.error_message) exec.error_message = *t.error_message;
  if (is_terminal(t.next)) {
    exec.finished_at = now;
  }
  exec.updated_at = now;
}

auto make_state_store(const StorageConfig& config)
    -> Result<std::unique_ptr<StateStore>> {
  if (config.engine == StorageEngine::Memory) {
    log::info("Using in-memory state store");
    return std::unique_ptr<StateStore>(std::make_unique<MemoryStateStore>());
  }

  auto store = std::make_unique<SqliteStateStore>(
      config.db_file, std::chrono::milliseconds(config.busy_timeout_ms));
  if (auto r = store->open(); !r) {
    return fail(r.error());
  }
  return std::unique_ptr<StateStore>(std::move(store));
}

}  // namespace orchestra
