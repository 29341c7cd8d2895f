#include "orchestra/orchestrator/dispatcher.hpp"
#include "orchestra/storage/memory_state_store.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <array>
#include <thread>

using namespace orchestra;
using namespace orchestra::test;
using namespace std::chrono_literals;

class DispatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    policy_.retry.backoff = Backoff{1ms, 2ms};
    policy_.infra_retry.backoff = Backoff{1ms, 2ms};
    policy_.default_annotations = {{"team", "infra"}, {"zone", "a"}};
    load(linear_pipeline());
  }

  auto load(PipelineSpec spec) -> void {
    auto compiled = PipelineGraph::compile(std::move(spec));
    ASSERT_TRUE(compiled.has_value());
    graph_ = *compiled;

    NewRun run;
    run.id = run_id(std::format("run-{}", ++runs_));
    run.pipeline_name = graph_->name();
    for (const auto& t : graph_->spec().tasks) {
      run.task_ids.push_back(t.id);
    }
    run.annotations = {{"team", "ml"}};
    auto created = store_.create_run(run);
    ASSERT_TRUE(created.has_value());
    run_ = *created;
  }

  auto dispatcher() -> Dispatcher {
    return Dispatcher(store_, launcher_, router_, policy_);
  }

  auto snapshot() -> RunState {
    auto state = store_.get_run_state(run_);
    EXPECT_TRUE(state.has_value());
    return state ? *state : RunState{};
  }

  auto exec(std::string_view task) -> TaskExecution {
    auto state = snapshot();
    const auto* e = state.find(task_id(task));
    EXPECT_NE(e, nullptr);
    return e ? *e : TaskExecution{};
  }

  auto index(std::string_view task) -> NodeIndex {
    return graph_->index_of(task_id(task));
  }

  auto dispatch(Dispatcher& d, std::string_view task) -> DispatchOutcome {
    auto r = d.dispatch(*graph_, snapshot(), index(task));
    EXPECT_TRUE(r.has_value());
    return r ? *r : DispatchOutcome{};
  }

  auto observe(Dispatcher& d, std::string_view task) -> DispatchOutcome {
    auto r = d.observe(*graph_, snapshot(), index(task));
    EXPECT_TRUE(r.has_value());
    return r ? *r : DispatchOutcome{};
  }

  // Drives task A to Succeeded so B becomes dispatchable.
  auto complete(Dispatcher& d, std::string_view task) -> void {
    ASSERT_EQ(dispatch(d, task).status, DispatchStatus::Launched);
    ASSERT_EQ(observe(d, task).status, DispatchStatus::Succeeded);
  }

  TempDir dir_;
  MemoryStateStore store_;
  FakeLauncher launcher_;
  ArtifactRouter router_{(dir_.path() / "data").string(),
                         (dir_.path() / "logs").string()};
  DispatchPolicy policy_;
  PipelineGraphPtr graph_;
  RunId run_;
  int runs_{0};
};

TEST_F(DispatcherTest, LaunchesPendingTask) {
  auto d = dispatcher();
  auto launched = dispatch(d, "A");

  EXPECT_EQ(launched.status, DispatchStatus::Launched);
  ASSERT_TRUE(launched.handle.has_value());
  EXPECT_EQ(launched.handle->attempt, 1);
  EXPECT_EQ(launched.handle->launcher_handle,
            std::format("fake:{}", launched.handle->execution_id));

  auto a = exec("A");
  EXPECT_EQ(a.status, TaskStatus::Running);
  EXPECT_EQ(a.attempt, 1);
  EXPECT_EQ(a.execution_id, launched.handle->execution_id);
  EXPECT_EQ(a.launcher_handle, launched.handle->launcher_handle);
  EXPECT_EQ(a.cache_key.size(), 64u);

  auto spec = launcher_.last_spec("A");
  EXPECT_EQ(spec.run_id, run_);
  EXPECT_EQ(spec.container.image, "busybox");
  ASSERT_TRUE(spec.output_uris.contains("out"));
  EXPECT_NE(spec.output_uris.at("out").find(a.execution_id.str()),
            std::string::npos);
  EXPECT_EQ(spec.annotations["team"], "ml");
  EXPECT_EQ(spec.annotations["zone"], "a");
}

TEST_F(DispatcherTest, SuccessRecordsOutputs) {
  auto d = dispatcher();
  complete(d, "A");

  auto a = exec("A");
  EXPECT_EQ(a.status, TaskStatus::Succeeded);
  EXPECT_EQ(a.exit_code, 0);
  ASSERT_TRUE(a.outputs.contains("out"));
  EXPECT_EQ(a.outputs.at("out").value, "A.out");

  auto b = dispatch(d, "B");
  EXPECT_EQ(b.status, DispatchStatus::Launched);
  const auto& inputs = launcher_.last_spec("B").inputs;
  EXPECT_EQ(std::get<ArtifactData>(inputs.at("in")).value, "A.out");
}

TEST_F(DispatcherTest, StaleSnapshotLosesClaim) {
  auto d = dispatcher();
  auto stale = snapshot();
  ASSERT_EQ(dispatch(d, "A").status, DispatchStatus::Launched);

  auto again = d.dispatch(*graph_, stale, index("A"));
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->status, DispatchStatus::NoOp);
  EXPECT_EQ(again->error, make_error_code(Error::StateStoreConflict));
  EXPECT_EQ(launcher_.launch_attempts("A"), 1);
}

TEST_F(DispatcherTest, ConcurrentDispatchLaunchesOnce) {
  auto view = snapshot();
  auto node = index("A");
  std::array<DispatchOutcome, 2> outcomes;
  {
    std::array<std::jthread, 2> workers;
    for (std::size_t i = 0; i < workers.size(); ++i) {
      workers[i] = std::jthread([&, i] {
        auto d = dispatcher();
        auto r = d.dispatch(*graph_, view, node);
        EXPECT_TRUE(r.has_value());
        if (r) {
          outcomes[i] = *r;
        }
      });
    }
  }

  auto launched = std::ranges::count_if(outcomes, [](const auto& o) {
    return o.status == DispatchStatus::Launched;
  });
  EXPECT_EQ(launched, 1);
  const auto& loser = outcomes[0].status == DispatchStatus::Launched
                          ? outcomes[1]
                          : outcomes[0];
  EXPECT_EQ(loser.status, DispatchStatus::NoOp);
  EXPECT_EQ(loser.error, make_error_code(Error::StateStoreConflict));
  EXPECT_EQ(launcher_.launch_attempts("A"), 1);
  EXPECT_EQ(exec("A").status, TaskStatus::Running);
}

TEST_F(DispatcherTest, NonPendingTaskIsNoOp) {
  auto d = dispatcher();
  ASSERT_EQ(dispatch(d, "A").status, DispatchStatus::Launched);

  auto again = dispatch(d, "A");
  EXPECT_EQ(again.status, DispatchStatus::NoOp);
  EXPECT_FALSE(again.error);
  EXPECT_EQ(launcher_.launch_attempts("A"), 1);
}

TEST_F(DispatcherTest, FailedAttemptIsRetriedThenFails) {
  policy_.retry.max_retries = 1;
  launcher_.script("A", {FakeOutcome::Fail, FakeOutcome::Fail});
  auto d = dispatcher();

  ASSERT_EQ(dispatch(d, "A").status, DispatchStatus::Launched);
  auto first = observe(d, "A");
  EXPECT_EQ(first.status, DispatchStatus::Retrying);
  EXPECT_TRUE(first.settled());

  auto a = exec("A");
  EXPECT_EQ(a.status, TaskStatus::Pending);
  EXPECT_EQ(a.retry_count, 1);
  EXPECT_EQ(a.exit_code, 1);
  EXPECT_TRUE(a.next_attempt_at.has_value());

  auto relaunch = dispatch(d, "A");
  ASSERT_EQ(relaunch.status, DispatchStatus::Launched);
  EXPECT_EQ(relaunch.handle->attempt, 2);
  EXPECT_EQ(observe(d, "A").status, DispatchStatus::Failed);

  a = exec("A");
  EXPECT_EQ(a.status, TaskStatus::Failed);
  EXPECT_EQ(a.retry_count, 1);
  EXPECT_EQ(a.attempt, 2);

  auto attempts = store_.list_attempts(run_, task_id("A"));
  ASSERT_TRUE(attempts.has_value());
  ASSERT_EQ(attempts->size(), 2u);
  EXPECT_EQ((*attempts)[0].status, TaskStatus::Failed);
  EXPECT_NE((*attempts)[0].execution_id, (*attempts)[1].execution_id);
}

TEST_F(DispatcherTest, TaskRetryLimitOverridesPolicy) {
  policy_.retry.max_retries = 3;
  auto p = linear_pipeline();
  p.tasks[0].max_retries = 0;
  load(p);
  launcher_.script("A", {FakeOutcome::Fail});
  auto d = dispatcher();

  ASSERT_EQ(dispatch(d, "A").status, DispatchStatus::Launched);
  EXPECT_EQ(observe(d, "A").status, DispatchStatus::Failed);
}

TEST_F(DispatcherTest, LaunchFailureCountsAgainstRetries) {
  policy_.retry.max_retries = 1;
  launcher_.script("A", {FakeOutcome::LaunchFailure, FakeOutcome::LaunchFailure});
  auto d = dispatcher();

  EXPECT_EQ(dispatch(d, "A").status, DispatchStatus::Retrying);
  EXPECT_EQ(exec("A").retry_count, 1);
  EXPECT_EQ(dispatch(d, "A").status, DispatchStatus::Failed);

  auto a = exec("A");
  EXPECT_EQ(a.status, TaskStatus::Failed);
  EXPECT_NE(a.error_message.find("launch failed"), std::string::npos);
}

TEST_F(DispatcherTest, UnreachableLauncherUsesInfraBudget) {
  policy_.retry.max_retries = 0;
  policy_.infra_retry.max_attempts = 2;
  launcher_.script("A", {FakeOutcome::Unreachable, FakeOutcome::Unreachable,
                         FakeOutcome::Unreachable});
  auto d = dispatcher();

  auto first = dispatch(d, "A");
  EXPECT_EQ(first.status, DispatchStatus::InfraRetry);
  EXPECT_EQ(first.error, make_error_code(Error::LauncherUnreachable));
  auto a = exec("A");
  EXPECT_EQ(a.status, TaskStatus::Pending);
  EXPECT_EQ(a.infra_retry_count, 1);
  EXPECT_EQ(a.retry_count, 0);

  EXPECT_EQ(dispatch(d, "A").status, DispatchStatus::InfraRetry);
  EXPECT_EQ(exec("A").infra_retry_count, 2);

  // Budget spent: the next outage counts as an ordinary failed attempt.
  EXPECT_EQ(dispatch(d, "A").status, DispatchStatus::Failed);
  EXPECT_EQ(exec("A").status, TaskStatus::Failed);
}

TEST_F(DispatcherTest, UnresolvedInputFailsWithoutRetry) {
  policy_.retry.max_retries = 3;
  auto d = dispatcher();

  auto b = dispatch(d, "B");
  EXPECT_EQ(b.status, DispatchStatus::Failed);
  EXPECT_FALSE(launcher_.launched("B"));

  auto exec_b = exec("B");
  EXPECT_EQ(exec_b.status, TaskStatus::Failed);
  EXPECT_EQ(exec_b.retry_count, 0);
  EXPECT_FALSE(exec_b.error_message.empty());
}

TEST_F(DispatcherTest, MissingDeclaredOutputFailsAttempt) {
  launcher_.script("A", {FakeOutcome::OmitOutputs});
  auto d = dispatcher();

  ASSERT_EQ(dispatch(d, "A").status, DispatchStatus::Launched);
  EXPECT_EQ(observe(d, "A").status, DispatchStatus::Failed);

  auto a = exec("A");
  EXPECT_EQ(a.status, TaskStatus::Failed);
  EXPECT_NE(a.error_message.find("'out'"), std::string::npos);
  EXPECT_TRUE(a.outputs.empty());
}

TEST_F(DispatcherTest, UndeclaredOutputsAreIgnored) {
  OutputArtifacts outputs{{"out", ArtifactData{.value = "1"}},
                          {"extra", ArtifactData{.value = "2"}}};
  launcher_.script("A", std::vector<FakeStep>{
                            FakeStep{.outputs = outputs}});
  auto d = dispatcher();
  complete(d, "A");

  auto a = exec("A");
  EXPECT_EQ(a.outputs.size(), 1u);
  EXPECT_EQ(a.outputs.at("out").value, "1");
}

TEST_F(DispatcherTest, HeldTaskStaysInFlight) {
  launcher_.script("A", {FakeOutcome::Hold});
  auto d = dispatcher();

  ASSERT_EQ(dispatch(d, "A").status, DispatchStatus::Launched);
  auto polled = observe(d, "A");
  EXPECT_EQ(polled.status, DispatchStatus::InFlight);
  EXPECT_FALSE(polled.settled());

  launcher_.release("A");
  EXPECT_EQ(observe(d, "A").status, DispatchStatus::Succeeded);
}

TEST_F(DispatcherTest, UnreachableDuringPollLeavesStateAlone) {
  launcher_.script("A", {FakeOutcome::Hold});
  auto d = dispatcher();
  ASSERT_EQ(dispatch(d, "A").status, DispatchStatus::Launched);

  launcher_.set_poll_unreachable(true);
  auto polled = observe(d, "A");
  EXPECT_EQ(polled.status, DispatchStatus::InfraError);
  EXPECT_EQ(exec("A").status, TaskStatus::Running);

  launcher_.set_poll_unreachable(false);
  launcher_.release("A");
  EXPECT_EQ(observe(d, "A").status, DispatchStatus::Succeeded);
}

TEST_F(DispatcherTest, LostExecutionIsFailedAttempt) {
  policy_.retry.max_retries = 1;
  launcher_.script("A", {FakeOutcome::Hold});
  auto d = dispatcher();
  ASSERT_EQ(dispatch(d, "A").status, DispatchStatus::Launched);

  launcher_.forget_all();
  EXPECT_EQ(observe(d, "A").status, DispatchStatus::Retrying);

  auto a = exec("A");
  EXPECT_EQ(a.status, TaskStatus::Pending);
  EXPECT_NE(a.error_message.find("lost track"), std::string::npos);
}

TEST_F(DispatcherTest, ExpiredClaimIsReclaimed) {
  policy_.claim_timeout = 0ms;
  auto claimed = store_.transition_task(
      run_, task_id("A"),
      TaskTransition{.expected = TaskStatus::Pending,
                     .next = TaskStatus::Starting,
                     .attempt = 1});
  ASSERT_TRUE(claimed.has_value() && *claimed);
  std::this_thread::sleep_for(5ms);

  auto d = dispatcher();
  EXPECT_EQ(observe(d, "A").status, DispatchStatus::Failed);
  EXPECT_EQ(exec("A").status, TaskStatus::Failed);
}

TEST_F(DispatcherTest, FreshClaimIsInFlight) {
  auto claimed = store_.transition_task(
      run_, task_id("A"),
      TaskTransition{.expected = TaskStatus::Pending,
                     .next = TaskStatus::Starting,
                     .attempt = 1});
  ASSERT_TRUE(claimed.has_value() && *claimed);

  auto d = dispatcher();
  EXPECT_EQ(observe(d, "A").status, DispatchStatus::InFlight);
  EXPECT_EQ(exec("A").status, TaskStatus::Starting);
}

TEST_F(DispatcherTest, CancelRunningTask) {
  launcher_.script("A", {FakeOutcome::Hold});
  auto d = dispatcher();
  ASSERT_EQ(dispatch(d, "A").status, DispatchStatus::Launched);

  auto cancelled = d.cancel(exec("A"));
  ASSERT_TRUE(cancelled.has_value());
  EXPECT_TRUE(*cancelled);
  EXPECT_EQ(exec("A").status, TaskStatus::Cancelled);
  EXPECT_EQ(launcher_.cancelled(), std::vector<std::string>{"A"});
}

TEST_F(DispatcherTest, CancelPendingAndFinishedTasks) {
  auto d = dispatcher();

  auto pending = d.cancel(exec("B"));
  ASSERT_TRUE(pending.has_value());
  EXPECT_TRUE(*pending);
  EXPECT_EQ(exec("B").status, TaskStatus::Cancelled);

  complete(d, "A");
  auto finished = d.cancel(exec("A"));
  ASSERT_TRUE(finished.has_value());
  EXPECT_FALSE(*finished);
  EXPECT_EQ(exec("A").status, TaskStatus::Succeeded);
  EXPECT_TRUE(launcher_.cancelled().empty());
}

TEST(DispatchStatusTest, Names) {
  EXPECT_EQ(to_string_view(DispatchStatus::Launched), "launched");
  EXPECT_EQ(to_string_view(DispatchStatus::InfraRetry), "infra-retry");
  EXPECT_EQ(to_string_view(DispatchStatus::NoOp), "no-op");
}
