#include "orchestra/orchestrator/run_controller.hpp"
#include "orchestra/storage/memory_state_store.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <future>
#include <thread>

using namespace orchestra;
using namespace orchestra::test;
using namespace std::chrono_literals;

class RunControllerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_ = fast_config(dir_.path());
  }

  auto controller() -> RunController& {
    if (!controller_) {
      controller_ = std::make_unique<RunController>(store_, launcher_, config_);
    }
    return *controller_;
  }

  auto submit(const PipelineSpec& spec, RunOptions options = {}) -> RunId {
    auto id = controller().submit(spec, std::move(options));
    EXPECT_TRUE(id.has_value());
    return id ? *id : RunId{};
  }

  auto drive(const RunId& id) -> RunStatus {
    auto status = controller().drive(id);
    EXPECT_TRUE(status.has_value());
    return status ? *status : RunStatus::Pending;
  }

  auto state(const RunId& id) -> RunState {
    auto s = store_.get_run_state(id);
    EXPECT_TRUE(s.has_value());
    return s ? *s : RunState{};
  }

  auto task_status(const RunId& id, std::string_view task) -> TaskStatus {
    auto s = state(id);
    const auto* exec = s.find(task_id(task));
    EXPECT_NE(exec, nullptr);
    return exec ? exec->status : TaskStatus::Pending;
  }

  // X fails, Y succeeds (or is held), Z consumes Y.
  static auto split_pipeline() -> PipelineSpec {
    PipelineSpec p;
    p.name = "split";
    p.components = basic_components();
    p.tasks = {
        task("X", "source"),
        task("Y", "source"),
        task("Z", "step", {{"in", from("Y", "out")}}),
    };
    return p;
  }

  TempDir dir_;
  Config config_;
  MemoryStateStore store_;
  FakeLauncher launcher_;
  std::unique_ptr<RunController> controller_;
};

TEST_F(RunControllerTest, LinearPipelineSucceeds) {
  auto id = submit(linear_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Succeeded);

  auto s = state(id);
  EXPECT_EQ(s.run.status, RunStatus::Succeeded);
  EXPECT_TRUE(s.run.started_at.has_value());
  EXPECT_TRUE(s.run.finished_at.has_value());
  EXPECT_EQ(s.count(TaskStatus::Succeeded), 3u);

  const auto& c_inputs = launcher_.last_spec("C").inputs;
  EXPECT_EQ(std::get<ArtifactData>(c_inputs.at("in")).value, "B.out");
  EXPECT_EQ(launcher_.total_launches(), 3);
}

TEST_F(RunControllerTest, FailureSkipsDownstreamOnly) {
  launcher_.script("B", {FakeOutcome::Fail});
  auto id = submit(diamond_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Failed);

  EXPECT_EQ(task_status(id, "A"), TaskStatus::Succeeded);
  EXPECT_EQ(task_status(id, "B"), TaskStatus::Failed);
  EXPECT_EQ(task_status(id, "C"), TaskStatus::Succeeded);
  EXPECT_EQ(task_status(id, "D"), TaskStatus::Skipped);
  EXPECT_FALSE(launcher_.launched("D"));

  auto s = state(id);
  EXPECT_NE(s.find(task_id("D"))->error_message.find("B"), std::string::npos);
}

TEST_F(RunControllerTest, TransientFailureIsRetried) {
  config_.retry.max_retries = 2;
  launcher_.script("A", {FakeOutcome::Fail, FakeOutcome::Succeed});
  auto id = submit(linear_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Succeeded);

  auto s = state(id);
  const auto* a = s.find(task_id("A"));
  EXPECT_EQ(a->retry_count, 1);
  EXPECT_EQ(a->attempt, 2);
  EXPECT_EQ(launcher_.launch_attempts("A"), 2);

  auto attempts = store_.list_attempts(id, task_id("A"));
  ASSERT_TRUE(attempts.has_value());
  ASSERT_EQ(attempts->size(), 2u);
  EXPECT_EQ((*attempts)[0].status, TaskStatus::Failed);
  EXPECT_EQ((*attempts)[1].status, TaskStatus::Succeeded);
}

TEST_F(RunControllerTest, RetriesExhaustedFailsRun) {
  config_.retry.max_retries = 1;
  launcher_.script("A", {FakeOutcome::Fail, FakeOutcome::Fail});
  auto id = submit(linear_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Failed);
  EXPECT_EQ(launcher_.launch_attempts("A"), 2);
  EXPECT_EQ(task_status(id, "B"), TaskStatus::Skipped);
  EXPECT_EQ(task_status(id, "C"), TaskStatus::Skipped);
}

TEST_F(RunControllerTest, ThreeConsecutiveFailuresExhaustTwoRetries) {
  config_.retry.max_retries = 2;
  launcher_.script("A", {FakeOutcome::Fail, FakeOutcome::Fail,
                         FakeOutcome::Fail});
  auto id = submit(linear_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Failed);
  EXPECT_EQ(launcher_.launch_attempts("A"), 3);

  auto s = state(id);
  const auto* a = s.find(task_id("A"));
  EXPECT_EQ(a->status, TaskStatus::Failed);
  EXPECT_EQ(a->retry_count, 2);
  EXPECT_EQ(task_status(id, "B"), TaskStatus::Skipped);
}

TEST_F(RunControllerTest, CancelStopsRunningAndPendingTasks) {
  launcher_.script("A", {FakeOutcome::Hold});
  auto id = submit(linear_pipeline());

  CancellationSource source;
  auto result = std::async(std::launch::async, [&] {
    return controller().drive(id, source.token());
  });
  ASSERT_TRUE(wait_until([&] { return launcher_.running() == 1; }));
  source.cancel();

  auto status = result.get();
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, RunStatus::Cancelled);

  auto s = state(id);
  EXPECT_TRUE(s.run.cancel_requested);
  EXPECT_EQ(s.count(TaskStatus::Cancelled), 3u);
  EXPECT_EQ(launcher_.cancelled(), std::vector<std::string>{"A"});
  EXPECT_FALSE(launcher_.launched("B"));
}

TEST_F(RunControllerTest, CancelFromAnotherController) {
  launcher_.script("A", {FakeOutcome::Hold});
  auto id = submit(linear_pipeline());

  auto result = std::async(std::launch::async,
                           [&] { return controller().drive(id); });
  ASSERT_TRUE(wait_until([&] { return launcher_.running() == 1; }));

  RunController other(store_, launcher_, config_);
  auto requested = other.request_cancel(id);
  ASSERT_TRUE(requested.has_value());
  EXPECT_TRUE(*requested);

  auto status = result.get();
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, RunStatus::Cancelled);

  auto late = other.request_cancel(id);
  ASSERT_TRUE(late.has_value());
  EXPECT_FALSE(*late);
}

TEST_F(RunControllerTest, TokenCancelWakesIdleDriver) {
  config_.orchestrator.poll_interval = 10s;
  launcher_.script("A", {FakeOutcome::Hold});
  auto id = submit(linear_pipeline());

  CancellationSource source;
  auto result = std::async(std::launch::async, [&] {
    return controller().drive(id, source.token());
  });
  ASSERT_TRUE(wait_until([&] { return launcher_.running() == 1; }));
  // Let the driver settle into its poll wait.
  std::this_thread::sleep_for(50ms);
  source.cancel();

  ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
  auto status = result.get();
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, RunStatus::Cancelled);
}

TEST_F(RunControllerTest, ControllersSharingALauncherAreAllNotified) {
  controller();
  {
    RunController second(store_, launcher_, config_);
    EXPECT_EQ(launcher_.subscribers(), 2u);
  }
  EXPECT_EQ(launcher_.subscribers(), 1u);
}

TEST_F(RunControllerTest, FinishedRunReleasesItsGraph) {
  auto id = submit(linear_pipeline());
  EXPECT_EQ(controller().cached_graphs(), 1u);
  EXPECT_EQ(drive(id), RunStatus::Succeeded);
  EXPECT_EQ(controller().cached_graphs(), 0u);

  launcher_.script("A", {FakeOutcome::Fail});
  auto failed = submit(linear_pipeline());
  EXPECT_EQ(drive(failed), RunStatus::Failed);
  EXPECT_EQ(controller().cached_graphs(), 0u);
}

TEST_F(RunControllerTest, FanInWaitsForBothBranches) {
  auto id = submit(diamond_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Succeeded);

  const auto& inputs = launcher_.last_spec("D").inputs;
  EXPECT_EQ(std::get<ArtifactData>(inputs.at("left")).value, "B.out");
  EXPECT_EQ(std::get<ArtifactData>(inputs.at("right")).value, "C.out");
}

TEST_F(RunControllerTest, CollectionInputGathersInOrder) {
  PipelineSpec p;
  p.name = "gather";
  p.components = {component("source", {}, {output("out")}),
                  component("pick", {input("all")}, {output("best")})};
  p.tasks = {
      task("m1", "source"),
      task("m2", "source"),
      task("m3", "source"),
      task("best", "pick",
           {{"all", CollectionArgument{{ref("m2", "out"), ref("m1", "out"),
                                        ref("m3", "out")}}}}),
  };
  auto id = submit(p);
  EXPECT_EQ(drive(id), RunStatus::Succeeded);

  const auto& all = std::get<std::vector<ArtifactData>>(
      launcher_.last_spec("best").inputs.at("all"));
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].value, "m2.out");
  EXPECT_EQ(all[1].value, "m1.out");
  EXPECT_EQ(all[2].value, "m3.out");
}

TEST_F(RunControllerTest, ContinuePolicyRunsIndependentBranches) {
  config_.orchestrator.failure_policy = FailurePolicy::Continue;
  launcher_.script("X", {FakeOutcome::Fail});
  auto id = submit(split_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Failed);
  EXPECT_EQ(task_status(id, "Z"), TaskStatus::Succeeded);
}

TEST_F(RunControllerTest, DrainPolicySkipsPendingTasks) {
  config_.orchestrator.failure_policy = FailurePolicy::Drain;
  launcher_.script("X", {FakeOutcome::Fail});
  auto id = submit(split_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Failed);

  EXPECT_EQ(task_status(id, "X"), TaskStatus::Failed);
  EXPECT_EQ(task_status(id, "Y"), TaskStatus::Succeeded);
  EXPECT_EQ(task_status(id, "Z"), TaskStatus::Skipped);
  EXPECT_FALSE(launcher_.launched("Z"));
}

TEST_F(RunControllerTest, CancelPolicyStopsInFlightTasks) {
  config_.orchestrator.failure_policy = FailurePolicy::Cancel;
  launcher_.script("X", {FakeOutcome::Fail});
  launcher_.script("Y", {FakeOutcome::Hold});
  auto id = submit(split_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Failed);

  EXPECT_EQ(task_status(id, "Y"), TaskStatus::Cancelled);
  EXPECT_EQ(task_status(id, "Z"), TaskStatus::Skipped);
  EXPECT_EQ(launcher_.cancelled(), std::vector<std::string>{"Y"});
}

TEST_F(RunControllerTest, OptionalTaskFailureDoesNotFailRun) {
  auto p = linear_pipeline();
  p.tasks[2].optional = true;
  launcher_.script("C", {FakeOutcome::Fail});
  auto id = submit(p);
  EXPECT_EQ(drive(id), RunStatus::Succeeded);
  EXPECT_EQ(task_status(id, "C"), TaskStatus::Failed);
}

TEST_F(RunControllerTest, PerRunLimitCapsInFlightTasks) {
  config_.orchestrator.max_in_flight_per_run = 2;
  PipelineSpec p;
  p.name = "wide";
  p.components = basic_components();
  for (int i = 0; i < 6; ++i) {
    p.tasks.push_back(task(std::format("t{}", i), "source"));
  }
  auto id = submit(p);
  EXPECT_EQ(drive(id), RunStatus::Succeeded);
  EXPECT_EQ(launcher_.max_running(), 2);
  EXPECT_EQ(launcher_.total_launches(), 6);
}

TEST_F(RunControllerTest, SharedLimiterCapsAcrossRuns) {
  auto limiter = std::make_shared<ConcurrencyLimiter>(1);
  RunController limited(store_, launcher_, config_, limiter);

  PipelineSpec p;
  p.name = "wide";
  p.components = basic_components();
  for (int i = 0; i < 4; ++i) {
    p.tasks.push_back(task(std::format("t{}", i), "source"));
  }
  auto first = limited.submit(p);
  auto second = limited.submit(p);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  auto a = std::async(std::launch::async, [&] { return limited.drive(*first); });
  auto b = std::async(std::launch::async, [&] { return limited.drive(*second); });
  auto sa = a.get();
  auto sb = b.get();
  ASSERT_TRUE(sa.has_value());
  ASSERT_TRUE(sb.has_value());
  EXPECT_EQ(*sa, RunStatus::Succeeded);
  EXPECT_EQ(*sb, RunStatus::Succeeded);
  EXPECT_EQ(launcher_.max_running(), 1);
  EXPECT_EQ(limiter->in_use(), 0u);
}

TEST_F(RunControllerTest, LauncherOutageUsesInfraBudget) {
  config_.infra_retry.max_attempts = 5;
  launcher_.script("A", {FakeOutcome::Unreachable, FakeOutcome::Unreachable,
                         FakeOutcome::Succeed});
  auto id = submit(linear_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Succeeded);

  auto s = state(id);
  const auto* a = s.find(task_id("A"));
  EXPECT_EQ(a->infra_retry_count, 2);
  EXPECT_EQ(a->retry_count, 0);
}

TEST_F(RunControllerTest, ExhaustedInfraBudgetFailsTask) {
  config_.infra_retry.max_attempts = 1;
  launcher_.script("A", {FakeOutcome::Unreachable, FakeOutcome::Unreachable});
  auto id = submit(linear_pipeline());
  EXPECT_EQ(drive(id), RunStatus::Failed);
  EXPECT_EQ(task_status(id, "A"), TaskStatus::Failed);
}

TEST_F(RunControllerTest, PipelineInputsReachTasks) {
  auto p = linear_pipeline();
  p.inputs = {PipelineInput{.name = "message"}};
  p.components.push_back(component("echo", {input("text")}, {}));
  p.tasks.push_back(task("E", "echo", {{"text", graph_input("message")}}));

  RunOptions options;
  options.inputs = {{"message", "hello"}};
  options.annotations = {{"owner", "ci"}};
  auto id = submit(p, options);
  EXPECT_EQ(drive(id), RunStatus::Succeeded);

  auto spec = launcher_.last_spec("E");
  EXPECT_EQ(std::get<ArtifactData>(spec.inputs.at("text")).value, "hello");
  EXPECT_EQ(spec.annotations["owner"], "ci");
}

TEST_F(RunControllerTest, SubmitRejectsInvalidPipeline) {
  auto p = linear_pipeline();
  p.tasks[0] = task("A", "step", {{"in", from("C", "out")}});

  std::vector<std::string> messages;
  auto id = controller().submit(p, {}, &messages);
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error(), make_error_code(Error::CycleDetected));
  EXPECT_FALSE(messages.empty());

  auto runs = store_.list_runs(10);
  ASSERT_TRUE(runs.has_value());
  EXPECT_TRUE(runs->empty());
}

TEST_F(RunControllerTest, SubmitRequiresPipelineInputs) {
  auto p = linear_pipeline();
  p.inputs = {PipelineInput{.name = "needed"},
              PipelineInput{.name = "defaulted", .default_value = "x"},
              PipelineInput{.name = "maybe", .optional = true}};

  auto id = controller().submit(p);
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error(), make_error_code(Error::MissingArgument));

  RunOptions options;
  options.inputs = {{"needed", "1"}, {"unknown", "2"}};
  EXPECT_TRUE(controller().submit(p, options).has_value());
}

TEST_F(RunControllerTest, SubmitRejectsDuplicateRunId) {
  RunOptions options;
  options.run_id = run_id("fixed");
  EXPECT_EQ(submit(linear_pipeline(), options), run_id("fixed"));

  auto again = controller().submit(linear_pipeline(), options);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::AlreadyExists));
}

TEST_F(RunControllerTest, UnknownRunIsNotFound) {
  auto step = controller().step(run_id("missing"));
  ASSERT_FALSE(step.has_value());
  EXPECT_EQ(step.error(), make_error_code(Error::NotFound));

  auto driven = controller().drive(run_id("missing"));
  ASSERT_FALSE(driven.has_value());
  EXPECT_EQ(driven.error(), make_error_code(Error::NotFound));
}

TEST_F(RunControllerTest, StepReportsProgress) {
  launcher_.script("A", {FakeOutcome::Hold});
  auto id = submit(linear_pipeline());

  auto first = controller().step(id);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->status, RunStatus::Running);
  EXPECT_EQ(first->dispatched, 1u);
  EXPECT_EQ(first->in_flight, 1u);
  EXPECT_TRUE(first->progressed());

  auto idle = controller().step(id);
  ASSERT_TRUE(idle.has_value());
  EXPECT_FALSE(idle->progressed());
  EXPECT_EQ(idle->in_flight, 1u);

  launcher_.release("A");
  auto settled = controller().step(id);
  ASSERT_TRUE(settled.has_value());
  EXPECT_EQ(settled->settled, 1u);
  EXPECT_EQ(settled->dispatched, 1u);
}

TEST_F(RunControllerTest, AnotherControllerCanDriveStoredRun) {
  auto id = submit(linear_pipeline());

  RunController other(store_, launcher_, config_);
  auto status = other.drive(id);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, RunStatus::Succeeded);

  auto record = store_.get_run(id);
  ASSERT_TRUE(record.has_value());
  auto graph = other.graph_for(*record);
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ((*graph)->name(), "linear");
}

TEST_F(RunControllerTest, UnparseableStoredPipelineFailsRun) {
  NewRun run;
  run.id = run_id("broken");
  run.pipeline_name = "broken";
  run.pipeline_spec = "{not json";
  run.task_ids = {task_id("A")};
  ASSERT_TRUE(store_.create_run(run).has_value());

  auto step = controller().step(run_id("broken"));
  ASSERT_TRUE(step.has_value());
  EXPECT_EQ(step->status, RunStatus::Failed);
}

TEST_F(RunControllerTest, EmptyPipelineIsRejected) {
  PipelineSpec p;
  p.name = "nothing";
  auto id = controller().submit(p);
  EXPECT_FALSE(id.has_value());
}

TEST(HardFailureTest, OnlyRequiredFailedTasksCount) {
  auto p = linear_pipeline();
  p.tasks[1].optional = true;
  auto graph = PipelineGraph::compile(p);
  ASSERT_TRUE(graph.has_value());

  TaskExecution exec;
  exec.task_id = task_id("A");
  exec.status = TaskStatus::Failed;
  EXPECT_TRUE(is_hard_failure(**graph, exec));

  exec.task_id = task_id("B");
  EXPECT_FALSE(is_hard_failure(**graph, exec));

  exec.task_id = task_id("A");
  exec.status = TaskStatus::Skipped;
  EXPECT_FALSE(is_hard_failure(**graph, exec));
}
