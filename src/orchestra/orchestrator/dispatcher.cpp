#include "orchestra/orchestrator/dispatcher.hpp"

#include "orchestra/storage/state_strings.hpp"
#include "orchestra/util/log.hpp"

#include <format>

namespace orchestra {

auto to_string_view(DispatchStatus s) noexcept -> std::string_view {
  switch (s) {
    case DispatchStatus::NoOp:
      return "no-op";
    case DispatchStatus::Launched:
      return "launched";
    case DispatchStatus::InFlight:
      return "in-flight";
    case DispatchStatus::Succeeded:
      return "succeeded";
    case DispatchStatus::Retrying:
      return "retrying";
    case DispatchStatus::InfraRetry:
      return "infra-retry";
    case DispatchStatus::Failed:
      return "failed";
    case DispatchStatus::InfraError:
      return "infra-error";
  }
  return "unknown";
}

namespace {

auto outcome(DispatchStatus status, const TaskId& task_id,
             std::error_code error = {}) -> DispatchOutcome {
  return DispatchOutcome{
      .status = status, .task_id = task_id, .handle = std::nullopt,
      .error = error};
}

}  // namespace

Dispatcher::Dispatcher(StateStore& store, ILauncher& launcher,
                       const ArtifactRouter& router, DispatchPolicy policy)
    : store_(store),
      launcher_(launcher),
      router_(router),
      policy_(std::move(policy)) {
}

auto Dispatcher::dispatch(const PipelineGraph& graph, const RunState& state,
                          NodeIndex idx) -> Result<DispatchOutcome> {
  const auto& task = graph.task(idx);
  const auto& run_id = state.run.id;
  const auto* exec = state.find(task.id);
  if (!exec) {
    return fail(Error::NotFound);
  }
  if (exec->status != TaskStatus::Pending) {
    return outcome(DispatchStatus::NoOp, task.id);
  }

  auto execution_id = generate_execution_id();
  int attempt = exec->attempt + 1;
  auto claimed = store_.transition_task(
      run_id, task.id,
      TaskTransition{.expected = TaskStatus::Pending,
                     .next = TaskStatus::Starting,
                     .attempt = attempt,
                     .execution_id = execution_id});
  if (!claimed) {
    return fail(claimed.error());
  }
  if (!*claimed) {
    log::warn("Task {}/{} was claimed elsewhere, skipping dispatch", run_id,
              task.id);
    return outcome(DispatchStatus::NoOp, task.id,
                   make_error_code(Error::StateStoreConflict));
  }
  log::debug("Task {}/{}: pending -> starting (attempt {})", run_id, task.id,
             attempt);

  auto inputs = ArtifactRouter::resolve_inputs(graph, idx, state);
  if (!inputs) {
    return fail_permanently(*exec, TaskStatus::Starting, std::nullopt,
                            inputs.error().message());
  }

  const auto& component = graph.component(idx);
  auto plan = router_.plan_outputs(component, execution_id);
  auto cache_key = ArtifactRouter::cache_key(component, *inputs);

  LaunchSpec spec{
      .run_id = run_id,
      .task_id = task.id,
      .execution_id = execution_id,
      .container = component.container,
      .inputs = *inputs,
      .output_uris = plan.output_uris,
      .log_uri = plan.log_uri,
      .staging_dir = plan.staging_dir,
      .annotations = ArtifactRouter::merge_annotations(
          policy_.default_annotations, state.run.annotations, task.annotations),
  };

  auto handle = launcher_.launch(spec);
  if (!handle) {
    auto message = std::format("launch failed: {}", handle.error().message());
    if (handle.error() == Error::LauncherUnreachable) {
      return fail_infra(task, *exec, TaskStatus::Starting, std::move(message));
    }
    if (handle.error() == Error::UnresolvedReference) {
      return fail_permanently(*exec, TaskStatus::Starting, std::nullopt,
                              std::move(message));
    }
    return fail_attempt(task, *exec, TaskStatus::Starting, std::nullopt,
                        std::move(message));
  }

  auto running = store_.transition_task(
      run_id, task.id,
      TaskTransition{.expected = TaskStatus::Starting,
                     .next = TaskStatus::Running,
                     .launcher_handle = *handle,
                     .inputs = std::move(*inputs),
                     .cache_key = std::move(cache_key)});
  if (!running || !*running) {
    // Cancelled or reclaimed while launching; the launch is not ours anymore.
    if (auto r = launcher_.cancel(*handle); !r) {
      log::warn("Failed to cancel orphaned launch of {}/{}: {}", run_id,
                task.id, r.error().message());
    }
    if (!running) {
      return fail(running.error());
    }
    log::warn("Task {}/{} left starting while launching", run_id, task.id);
    return outcome(DispatchStatus::NoOp, task.id,
                   make_error_code(Error::StateStoreConflict));
  }

  log::info("Task {}/{} launched (attempt {}, execution {})", run_id, task.id,
            attempt, execution_id);
  DispatchOutcome result = outcome(DispatchStatus::Launched, task.id);
  result.handle = TaskExecutionHandle{.run_id = run_id,
                                      .task_id = task.id,
                                      .execution_id = execution_id,
                                      .attempt = attempt,
                                      .launcher_handle = *handle};
  return result;
}

auto Dispatcher::observe(const PipelineGraph& graph, const RunState& state,
                         NodeIndex idx) -> Result<DispatchOutcome> {
  const auto& task = graph.task(idx);
  const auto& run_id = state.run.id;
  const auto* exec = state.find(task.id);
  if (!exec) {
    return fail(Error::NotFound);
  }

  if (exec->status == TaskStatus::Starting) {
    auto now = Clock::now();
    if (exec->started_at && now - *exec->started_at > policy_.claim_timeout) {
      log::warn("Task {}/{}: claim expired before launch completed", run_id,
                task.id);
      return fail_attempt(task, *exec, TaskStatus::Starting, std::nullopt,
                          "claim expired before launch completed");
    }
    return outcome(DispatchStatus::InFlight, task.id);
  }
  if (exec->status != TaskStatus::Running) {
    return outcome(DispatchStatus::NoOp, task.id);
  }

  auto status = launcher_.poll(exec->launcher_handle);
  if (!status) {
    if (status.error() == Error::LauncherUnreachable) {
      log::warn("Launcher unreachable while polling {}/{}", run_id, task.id);
      return outcome(DispatchStatus::InfraError, task.id, status.error());
    }
    log::warn("Polling {}/{} failed: {}", run_id, task.id,
              status.error().message());
    return fail_attempt(task, *exec, TaskStatus::Running, std::nullopt,
                        std::format("poll failed: {}", status.error().message()));
  }

  switch (status->state) {
    case LaunchState::Pending:
    case LaunchState::Running:
      return outcome(DispatchStatus::InFlight, task.id);

    case LaunchState::Failed: {
      auto error = status->error.empty()
                       ? std::format("exited with code {}",
                                     status->exit_code.value_or(-1))
                       : status->error;
      return fail_attempt(task, *exec, TaskStatus::Running, status->exit_code,
                          std::move(error));
    }

    case LaunchState::Unknown:
      return fail_attempt(
          task, *exec, TaskStatus::Running, std::nullopt,
          std::format("launcher lost track of execution: {}", status->error));

    case LaunchState::Succeeded:
      break;
  }

  const auto& component = graph.component(idx);
  for (const auto& output : component.outputs) {
    if (!status->outputs.contains(output.name)) {
      return fail_attempt(
          task, *exec, TaskStatus::Running, status->exit_code,
          std::format("launcher reported no artifact for output '{}'",
                      output.name));
    }
  }
  for (const auto& [port, artifact] : status->outputs) {
    if (!component.find_output(port)) {
      continue;
    }
    if (auto r = store_.record_task_output(run_id, task.id, port, artifact);
        !r) {
      return fail(r.error());
    }
  }

  auto done = store_.transition_task(
      run_id, task.id,
      TaskTransition{.expected = TaskStatus::Running,
                     .next = TaskStatus::Succeeded,
                     .exit_code = status->exit_code.value_or(0)});
  if (!done) {
    return fail(done.error());
  }
  if (!*done) {
    return outcome(DispatchStatus::NoOp, task.id,
                   make_error_code(Error::StateStoreConflict));
  }
  log::info("Task {}/{} succeeded", run_id, task.id);
  return outcome(DispatchStatus::Succeeded, task.id);
}

auto Dispatcher::cancel(const TaskExecution& exec) -> Result<bool> {
  if (!is_in_flight(exec.status) && exec.status != TaskStatus::Pending) {
    return false;
  }
  if (exec.status == TaskStatus::Running && !exec.launcher_handle.empty()) {
    auto r = launcher_.cancel(exec.launcher_handle);
    if (!r) {
      log::warn("Launcher could not cancel {}/{}: {}", exec.run_id,
                exec.task_id, r.error().message());
    } else if (!*r) {
      log::debug("Nothing running at the launcher for {}/{}", exec.run_id,
                 exec.task_id);
    }
  }
  auto moved = store_.transition_task(
      exec.run_id, exec.task_id,
      TaskTransition{.expected = exec.status,
                     .next = TaskStatus::Cancelled,
                     .error_message = std::string{"cancelled"}});
  if (moved && *moved) {
    log::info("Task {}/{}: {} -> cancelled", exec.run_id, exec.task_id,
              exec.status);
  }
  return moved;
}

auto Dispatcher::fail_attempt(const TaskSpec& task, const TaskExecution& exec,
                              TaskStatus from, std::optional<int> exit_code,
                              std::string error) -> Result<DispatchOutcome> {
  int max_retries = task.max_retries.value_or(policy_.retry.max_retries);
  if (exec.retry_count >= max_retries) {
    return fail_permanently(exec, from, exit_code, std::move(error));
  }

  int retry = exec.retry_count + 1;
  auto delay = policy_.retry.backoff.delay(retry);
  auto moved = store_.transition_task(
      exec.run_id, exec.task_id,
      TaskTransition{.expected = from,
                     .next = TaskStatus::Pending,
                     .retry_count = retry,
                     .exit_code = exit_code,
                     .error_message = error,
                     .next_attempt_at = Clock::now() + delay});
  if (!moved) {
    return fail(moved.error());
  }
  if (!*moved) {
    return outcome(DispatchStatus::NoOp, exec.task_id,
                   make_error_code(Error::StateStoreConflict));
  }
  log::warn("Task {}/{} failed ({}), retry {}/{} in {}ms", exec.run_id,
            exec.task_id, error, retry, max_retries, delay.count());
  return outcome(DispatchStatus::Retrying, exec.task_id,
                 make_error_code(Error::LaunchFailure));
}

auto Dispatcher::fail_infra(const TaskSpec& task, const TaskExecution& exec,
                            TaskStatus from, std::string error)
    -> Result<DispatchOutcome> {
  if (exec.infra_retry_count >= policy_.infra_retry.max_attempts) {
    log::warn("Task {}/{}: infrastructure retry budget exhausted", exec.run_id,
              exec.task_id);
    return fail_attempt(task, exec, from, std::nullopt, std::move(error));
  }

  int retry = exec.infra_retry_count + 1;
  auto delay = policy_.infra_retry.backoff.delay(retry);
  auto moved = store_.transition_task(
      exec.run_id, exec.task_id,
      TaskTransition{.expected = from,
                     .next = TaskStatus::Pending,
                     .infra_retry_count = retry,
                     .error_message = error,
                     .next_attempt_at = Clock::now() + delay});
  if (!moved) {
    return fail(moved.error());
  }
  if (!*moved) {
    return outcome(DispatchStatus::NoOp, exec.task_id,
                   make_error_code(Error::StateStoreConflict));
  }
  log::warn("Task {}/{}: launcher unreachable, infra retry {}/{} in {}ms",
            exec.run_id, exec.task_id, retry, policy_.infra_retry.max_attempts,
            delay.count());
  return outcome(DispatchStatus::InfraRetry, exec.task_id,
                 make_error_code(Error::LauncherUnreachable));
}

auto Dispatcher::fail_permanently(const TaskExecution& exec, TaskStatus from,
                                  std::optional<int> exit_code,
                                  std::string error) -> Result<DispatchOutcome> {
  auto moved = store_.transition_task(
      exec.run_id, exec.task_id,
      TaskTransition{.expected = from,
                     .next = TaskStatus::Failed,
                     .exit_code = exit_code,
                     .error_message = error});
  if (!moved) {
    return fail(moved.error());
  }
  if (!*moved) {
    return outcome(DispatchStatus::NoOp, exec.task_id,
                   make_error_code(Error::StateStoreConflict));
  }
  log::error("Task {}/{} failed: {}", exec.run_id, exec.task_id, error);
  return outcome(DispatchStatus::Failed, exec.task_id);
}

}  // namespace orchestra
