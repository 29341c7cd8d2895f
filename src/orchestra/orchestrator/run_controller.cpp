#include "orchestra/orchestrator/run_controller.hpp"

#include "orchestra/storage/state_strings.hpp"
#include "orchestra/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <thread>

namespace orchestra {

auto is_hard_failure(const PipelineGraph& graph, const TaskExecution& exec)
    -> bool {
  if (exec.status != TaskStatus::Failed) {
    return false;
  }
  auto idx = graph.index_of(exec.task_id);
  return idx == kInvalidNode || !graph.task(idx).optional;
}

RunController::RunController(StateStore& store, ILauncher& launcher,
                             Config config,
                             std::shared_ptr<ConcurrencyLimiter> limiter)
    : store_(store),
      launcher_(launcher),
      config_(std::move(config)),
      router_(config_.orchestrator.data_root, config_.orchestrator.logs_root),
      dispatcher_(store_, launcher_, router_,
                  DispatchPolicy{
                      .retry = config_.retry,
                      .infra_retry = config_.infra_retry,
                      .claim_timeout = config_.orchestrator.claim_timeout,
                      .default_annotations =
                          config_.orchestrator.default_annotations,
                  }),
      limiter_(limiter ? std::move(limiter)
                       : std::make_shared<ConcurrencyLimiter>(static_cast<std::size_t>(
                             std::max(1, config_.orchestrator.max_in_flight_global)))),
      notifier_(std::make_shared<Notifier>()) {
  launcher_.subscribe(notifier_);
}

RunController::~RunController() = default;

auto RunController::submit(const PipelineSpec& spec, RunOptions options,
                           std::vector<std::string>* messages)
    -> Result<RunId> {
  std::vector<std::string> local;
  auto* out = messages ? messages : &local;

  auto graph = PipelineGraph::compile(spec, out);
  if (!graph) {
    log::error("Pipeline '{}' rejected: {}", spec.name, graph.error().message());
    for (const auto& msg : *out) {
      log::error("  {}", msg);
    }
    return fail(graph.error());
  }

  for (const auto& input : spec.inputs) {
    if (!options.inputs.contains(input.name) && !input.default_value &&
        !input.optional) {
      auto msg = std::format("Pipeline input '{}' is required", input.name);
      log::error("{}", msg);
      out->push_back(std::move(msg));
      return fail(Error::MissingArgument);
    }
  }
  for (const auto& [name, _] : options.inputs) {
    if (!(*graph)->find_input(name)) {
      log::warn("Ignoring unknown run input '{}'", name);
    }
  }

  NewRun run{
      .id = std::move(options.run_id),
      .pipeline_name = spec.name,
      .pipeline_spec = serialize_pipeline(spec),
      .task_ids = {},
      .inputs = std::move(options.inputs),
      .annotations = std::move(options.annotations),
  };
  run.task_ids.reserve(spec.tasks.size());
  for (const auto& task : spec.tasks) {
    run.task_ids.push_back(task.id);
  }

  auto run_id = store_.create_run(run);
  if (!run_id) {
    log::error("Failed to create run for '{}': {}", spec.name,
               run_id.error().message());
    return fail(run_id.error());
  }

  {
    std::scoped_lock lock(graphs_mu_);
    graphs_[*run_id] = *graph;
  }
  log::info("Run {} created for pipeline '{}' ({} tasks)", *run_id, spec.name,
            spec.tasks.size());
  return run_id;
}

auto RunController::graph_for(const RunRecord& run)
    -> Result<PipelineGraphPtr> {
  {
    std::scoped_lock lock(graphs_mu_);
    if (auto it = graphs_.find(run.id); it != graphs_.end()) {
      return it->second;
    }
  }

  auto spec = parse_pipeline(std::string_view{run.pipeline_spec});
  if (!spec) {
    log::error("Run {}: stored pipeline does not parse", run.id);
    return fail(spec.error());
  }
  std::vector<std::string> messages;
  auto graph = PipelineGraph::compile(std::move(*spec), &messages);
  if (!graph) {
    log::error("Run {}: stored pipeline does not compile: {}", run.id,
               messages.empty() ? graph.error().message() : messages.front());
    return fail(graph.error());
  }

  std::scoped_lock lock(graphs_mu_);
  graphs_.emplace(run.id, *graph);
  return *graph;
}

auto RunController::step(const RunId& run_id) -> Result<StepReport> {
  auto state = store_.get_run_state(run_id);
  if (!state) {
    return fail(state.error());
  }

  StepReport report;
  report.status = state->run.status;
  if (is_terminal(state->run.status)) {
    release_run(run_id);
    return report;
  }

  auto graph = graph_for(state->run);
  if (!graph) {
    // A run whose pipeline cannot be rebuilt can never make progress.
    auto moved = store_.transition_run(run_id, state->run.status,
                                       RunStatus::Failed);
    if (!moved) {
      return fail(moved.error());
    }
    report.status = RunStatus::Failed;
    return report;
  }
  const auto& g = **graph;

  if (state->run.status == RunStatus::Pending) {
    auto started =
        store_.transition_run(run_id, RunStatus::Pending, RunStatus::Running);
    if (!started) {
      return fail(started.error());
    }
    if (*started) {
      log::info("Run {}: pending -> running", run_id);
    }
  }

  auto reload = [&]() -> Result<void> {
    auto fresh = store_.get_run_state(run_id);
    if (!fresh) {
      return fail(fresh.error());
    }
    state = std::move(fresh);
    return ok();
  };

  if (state->run.cancel_requested) {
    if (auto r = apply_cancel(*state, report); !r) {
      return fail(r.error());
    }
  } else {
    if (auto r = observe_in_flight(g, *state, report); !r) {
      return fail(r.error());
    }
    if (report.settled > 0) {
      if (auto r = reload(); !r) {
        return fail(r.error());
      }
    }

    auto halted = apply_failure_policy(g, *state, report);
    if (!halted) {
      return fail(halted.error());
    }

    if (!*halted) {
      auto readiness = ReadinessResolver::resolve(g, *state, Clock::now());
      report.deferred = readiness.deferred.size();
      report.next_wakeup = readiness.next_wakeup;
      if (auto r = apply_skips(run_id, readiness.skip, report); !r) {
        return fail(r.error());
      }
      if (auto r = dispatch_ready(g, *state, readiness.ready, report); !r) {
        return fail(r.error());
      }
    }
  }

  if (auto r = reload(); !r) {
    return fail(r.error());
  }
  report.in_flight = state->in_flight();

  auto status = settle(g, *state);
  if (!status) {
    return fail(status.error());
  }
  report.status = *status;
  if (report.terminal()) {
    release_run(run_id);
  }
  return report;
}

auto RunController::release_run(const RunId& run_id) -> void {
  limiter_->forget(run_id);
  std::scoped_lock lock(graphs_mu_);
  graphs_.erase(run_id);
}

auto RunController::cached_graphs() const -> std::size_t {
  std::scoped_lock lock(graphs_mu_);
  return graphs_.size();
}

auto RunController::observe_in_flight(const PipelineGraph& graph,
                                      const RunState& state,
                                      StepReport& report) -> Result<void> {
  for (const auto& exec : state.tasks) {
    if (!is_in_flight(exec.status)) {
      continue;
    }
    auto idx = graph.index_of(exec.task_id);
    if (idx == kInvalidNode) {
      continue;
    }
    auto result = dispatcher_.observe(graph, state, idx);
    if (!result) {
      log::error("Run {}: observing task {} failed: {}", state.run.id,
                 exec.task_id, result.error().message());
      return fail(result.error());
    }
    if (result->settled()) {
      ++report.settled;
    }
  }
  return ok();
}

auto RunController::apply_cancel(const RunState& state, StepReport& report)
    -> Result<void> {
  for (const auto& exec : state.tasks) {
    if (is_terminal(exec.status)) {
      continue;
    }
    auto moved = dispatcher_.cancel(exec);
    if (!moved) {
      return fail(moved.error());
    }
    if (*moved) {
      ++report.cancelled;
    }
  }
  if (report.cancelled > 0) {
    log::info("Run {}: cancelled {} task(s)", state.run.id, report.cancelled);
  }
  return ok();
}

auto RunController::apply_failure_policy(const PipelineGraph& graph,
                                         const RunState& state,
                                         StepReport& report) -> Result<bool> {
  auto policy = config_.orchestrator.failure_policy;
  if (policy == FailurePolicy::Continue) {
    return false;
  }

  auto failed = std::ranges::find_if(state.tasks, [&](const TaskExecution& t) {
    return is_hard_failure(graph, t);
  });
  if (failed == state.tasks.end()) {
    return false;
  }

  for (const auto& exec : state.tasks) {
    if (exec.status == TaskStatus::Pending) {
      auto moved = store_.transition_task(
          state.run.id, exec.task_id,
          TaskTransition{
              .expected = TaskStatus::Pending,
              .next = TaskStatus::Skipped,
              .error_message = std::format("run halted after task {} failed",
                                           failed->task_id)});
      if (!moved) {
        return fail(moved.error());
      }
      if (*moved) {
        ++report.skipped;
        log::debug("Task {}/{}: pending -> skipped ({} policy)", state.run.id,
                   exec.task_id, to_string_view(policy));
      }
    } else if (policy == FailurePolicy::Cancel && is_in_flight(exec.status)) {
      auto moved = dispatcher_.cancel(exec);
      if (!moved) {
        return fail(moved.error());
      }
      if (*moved) {
        ++report.cancelled;
      }
    }
  }
  return true;
}

auto RunController::apply_skips(const RunId& run_id,
                                const std::vector<SkipDecision>& skips,
                                StepReport& report) -> Result<void> {
  for (const auto& skip : skips) {
    auto moved = store_.transition_task(
        run_id, skip.task_id,
        TaskTransition{.expected = TaskStatus::Pending,
                       .next = TaskStatus::Skipped,
                       .error_message = std::format(
                           "upstream task {} did not succeed", skip.blocked_by)});
    if (!moved) {
      return fail(moved.error());
    }
    if (*moved) {
      ++report.skipped;
      log::info("Task {}/{} skipped: upstream {} did not succeed", run_id,
                skip.task_id, skip.blocked_by);
    }
  }
  return ok();
}

auto RunController::dispatch_ready(const PipelineGraph& graph,
                                   const RunState& state,
                                   const std::vector<TaskId>& ready,
                                   StepReport& report) -> Result<void> {
  if (ready.empty()) {
    return ok();
  }

  auto in_flight = state.in_flight();
  auto per_run = static_cast<std::size_t>(
      std::max(0, config_.orchestrator.max_in_flight_per_run));
  auto room = per_run > in_flight ? per_run - in_flight : 0;
  auto wanted = std::min(ready.size(), room);
  auto granted = limiter_->reserve(state.run.id, in_flight, wanted);
  if (granted < ready.size()) {
    log::debug("Run {}: {} ready, {} dispatched (in flight {}, {}/{} slots "
               "in use)",
               state.run.id, ready.size(), granted, in_flight,
               limiter_->in_use(), limiter_->limit());
  }
  if (granted == 0) {
    return ok();
  }

  std::vector<Result<DispatchOutcome>> results(granted);
  std::atomic<std::size_t> next{0};
  auto worker = [&] {
    for (auto i = next.fetch_add(1); i < granted; i = next.fetch_add(1)) {
      results[i] = dispatcher_.dispatch(graph, state, graph.index_of(ready[i]));
    }
  };

  auto threads = std::min<std::size_t>(
      granted,
      static_cast<std::size_t>(std::max(1, config_.orchestrator.dispatch_threads)));
  {
    std::vector<std::jthread> pool;
    pool.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
      pool.emplace_back(worker);
    }
  }

  std::error_code first_error;
  for (const auto& r : results) {
    if (!r) {
      if (!first_error) {
        first_error = r.error();
      }
      continue;
    }
    if (r->status == DispatchStatus::Launched) {
      ++report.dispatched;
    } else if (r->settled()) {
      ++report.settled;
    }
  }
  if (first_error) {
    log::error("Run {}: dispatch aborted: {}", state.run.id,
               first_error.message());
    return fail(first_error);
  }
  return ok();
}

auto RunController::settle(const PipelineGraph& graph, const RunState& state)
    -> Result<RunStatus> {
  bool open = std::ranges::any_of(state.tasks, [](const TaskExecution& t) {
    return !is_terminal(t.status);
  });
  if (open) {
    return state.run.status == RunStatus::Pending ? RunStatus::Running
                                                  : state.run.status;
  }

  RunStatus final_status = RunStatus::Succeeded;
  if (state.run.cancel_requested) {
    final_status = RunStatus::Cancelled;
  } else if (std::ranges::any_of(state.tasks, [&](const TaskExecution& t) {
               return is_hard_failure(graph, t);
             })) {
    final_status = RunStatus::Failed;
  }

  auto from = state.run.status == RunStatus::Pending ? RunStatus::Pending
                                                     : RunStatus::Running;
  auto moved = store_.transition_run(state.run.id, from, final_status);
  if (!moved) {
    return fail(moved.error());
  }
  if (!*moved) {
    auto run = store_.get_run(state.run.id);
    if (!run) {
      return fail(run.error());
    }
    return run->status;
  }
  log::info("Run {}: {} -> {} ({} succeeded, {} failed, {} skipped)",
            state.run.id, from, final_status,
            state.count(TaskStatus::Succeeded), state.count(TaskStatus::Failed),
            state.count(TaskStatus::Skipped));
  return final_status;
}

auto RunController::drive(const RunId& run_id, CancellationToken token)
    -> Result<RunStatus> {
  token.wake_on_cancel(notifier_);
  bool cancel_sent = false;
  while (true) {
    if (!cancel_sent && token.is_cancelled()) {
      cancel_sent = true;
      if (auto r = request_cancel(run_id); !r) {
        log::warn("Run {}: cancel request failed: {}", run_id,
                  r.error().message());
      }
    }

    auto report = step(run_id);
    if (!report) {
      if (report.error() == Error::NotFound) {
        return fail(report.error());
      }
      log::warn("Run {}: iteration failed ({}), retrying", run_id,
                report.error().message());
      notifier_->wait_for(config_.orchestrator.poll_interval);
      continue;
    }
    if (report->terminal()) {
      return report->status;
    }
    if (report->progressed()) {
      continue;
    }

    auto timeout = config_.orchestrator.poll_interval;
    if (report->next_wakeup) {
      auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
          *report->next_wakeup - Clock::now());
      timeout = std::clamp(until, std::chrono::milliseconds{0}, timeout);
    }
    notifier_->wait_for(timeout);
  }
}

auto RunController::request_cancel(const RunId& run_id) -> Result<bool> {
  auto requested = store_.request_cancel(run_id);
  if (!requested) {
    return fail(requested.error());
  }
  if (*requested) {
    log::info("Run {}: cancel requested", run_id);
    notifier_->notify();
  }
  return requested;
}

}  // namespace orchestra
