#include "orchestra/storage/memory_state_store.hpp"

#include <algorithm>

namespace orchestra {

auto MemoryStateStore::find_task(const RunId& run_id, const TaskId& task_id)
    -> TaskEntry* {
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    return nullptr;
  }
  auto& tasks = it->second.tasks;
  auto t = std::ranges::find_if(
      tasks, [&](const TaskEntry& e) { return e.exec.task_id == task_id; });
  return t != tasks.end() ? &*t : nullptr;
}

auto MemoryStateStore::create_run(const NewRun& run) -> Result<RunId> {
  std::scoped_lock lock(mu_);
  RunId id = run.id ? *run.id : generate_run_id();
  if (runs_.contains(id)) {
    return fail(Error::AlreadyExists);
  }

  auto now = Clock::now();
  RunEntry entry;
  entry.record.id = id;
  entry.record.pipeline_name = run.pipeline_name;
  entry.record.pipeline_spec = run.pipeline_spec;
  entry.record.inputs = run.inputs;
  entry.record.annotations = run.annotations;
  entry.record.created_at = now;

  entry.tasks.reserve(run.task_ids.size());
  for (const auto& task_id : run.task_ids) {
    TaskEntry t;
    t.exec.run_id = id;
    t.exec.task_id = task_id;
    t.exec.updated_at = now;
    entry.tasks.push_back(std::move(t));
  }

  runs_.emplace(id, std::move(entry));
  order_.push_back(id);
  return id;
}

auto MemoryStateStore::get_run(const RunId& run_id) -> Result<RunRecord> {
  std::scoped_lock lock(mu_);
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    return fail(Error::NotFound);
  }
  return it->second.record;
}

auto MemoryStateStore::get_run_state(const RunId& run_id) -> Result<RunState> {
  std::scoped_lock lock(mu_);
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    return fail(Error::NotFound);
  }
  RunState state;
  state.run = it->second.record;
  state.tasks.reserve(it->second.tasks.size());
  for (const auto& t : it->second.tasks) {
    state.tasks.push_back(t.exec);
  }
  return state;
}

auto MemoryStateStore::transition_task(const RunId& run_id,
                                       const TaskId& task_id,
                                       const TaskTransition& t)
    -> Result<bool> {
  std::scoped_lock lock(mu_);
  auto* entry = find_task(run_id, task_id);
  if (!entry) {
    return fail(Error::NotFound);
  }
  if (entry->exec.status != t.expected) {
    return false;
  }

  auto now = Clock::now();
  bool closes_attempt = is_in_flight(t.expected) && !is_in_flight(t.next);
  apply_transition(entry->exec, t, now);

  if (t.next == TaskStatus::Starting) {
    TaskAttempt attempt;
    attempt.attempt = entry->exec.attempt;
    attempt.execution_id = entry->exec.execution_id;
    attempt.status = TaskStatus::Starting;
    attempt.started_at = now;
    entry->attempts.push_back(std::move(attempt));
  } else if (!entry->attempts.empty() &&
             (closes_attempt || t.next == TaskStatus::Running)) {
    auto& attempt = entry->attempts.back();
    attempt.status = attempt_outcome(t.next);
    attempt.launcher_handle = entry->exec.launcher_handle;
    attempt.exit_code = entry->exec.exit_code;
    attempt.error_message = entry->exec.error_message;
    if (closes_attempt) {
      attempt.finished_at = now;
    }
  }
  return true;
}

auto MemoryStateStore::record_task_output(const RunId& run_id,
                                          const TaskId& task_id,
                                          std::string_view port,
                                          const ArtifactData& artifact)
    -> Result<void> {
  std::scoped_lock lock(mu_);
  auto* entry = find_task(run_id, task_id);
  if (!entry) {
    return fail(Error::NotFound);
  }
  entry->exec.outputs[std::string(port)] = artifact;
  entry->exec.updated_at = Clock::now();
  return ok();
}

auto MemoryStateStore::transition_run(const RunId& run_id, RunStatus expected,
                                      RunStatus next) -> Result<bool> {
  std::scoped_lock lock(mu_);
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    return fail(Error::NotFound);
  }
  auto& record = it->second.record;
  if (record.status != expected) {
    return false;
  }
  record.status = next;
  auto now = Clock::now();
  if (next == RunStatus::Running && !record.started_at) {
    record.started_at = now;
  }
  if (is_terminal(next)) {
    record.finished_at = now;
  }
  return true;
}

auto MemoryStateStore::request_cancel(const RunId& run_id) -> Result<bool> {
  std::scoped_lock lock(mu_);
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    return fail(Error::NotFound);
  }
  auto& record = it->second.record;
  if (is_terminal(record.status)) {
    return false;
  }
  record.cancel_requested = true;
  return true;
}

auto MemoryStateStore::list_incomplete_runs() -> Result<std::vector<RunId>> {
  std::scoped_lock lock(mu_);
  std::vector<RunId> ids;
  for (const auto& id : order_) {
    if (!is_terminal(runs_.at(id).record.status)) {
      ids.push_back(id);
    }
  }
  return ids;
}

auto MemoryStateStore::list_attempts(const RunId& run_id,
                                     const TaskId& task_id)
    -> Result<std::vector<TaskAttempt>> {
  std::scoped_lock lock(mu_);
  auto* entry = find_task(run_id, task_id);
  if (!entry) {
    return fail(Error::NotFound);
  }
  return entry->attempts;
}

auto MemoryStateStore::list_runs(std::size_t limit)
    -> Result<std::vector<RunRecord>> {
  std::scoped_lock lock(mu_);
  std::vector<RunRecord> records;
  for (auto it = order_.rbegin(); it != order_.rend() && records.size() < limit;
       ++it) {
    records.push_back(runs_.at(*it).record);
  }
  return records;
}

}  // namespace orchestra
