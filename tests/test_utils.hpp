#pragma once

#include "orchestra/config/config.hpp"
#include "orchestra/graph/pipeline.hpp"
#include "orchestra/launcher/launcher.hpp"
#include "orchestra/util/id.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace orchestra::test {

[[nodiscard]] inline auto task_id(std::string_view s) -> TaskId {
  return TaskId{std::string{s}};
}

[[nodiscard]] inline auto run_id(std::string_view s) -> RunId {
  return RunId{std::string{s}};
}

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            std::format("orchestra_test_{}_{}_{}", ::getpid(),
                        counter.fetch_add(1),
                        std::chrono::steady_clock::now().time_since_epoch().count());
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path& {
    return path_;
  }
  [[nodiscard]] auto file(std::string_view name) const -> std::string {
    return (path_ / name).string();
  }

private:
  std::filesystem::path path_;
};

// Defaults tuned so scenario tests finish in milliseconds.
[[nodiscard]] inline auto fast_config(const std::filesystem::path& root = {})
    -> Config {
  Config config;
  config.storage.engine = StorageEngine::Memory;
  config.orchestrator.poll_interval = std::chrono::milliseconds(5);
  config.orchestrator.dispatch_threads = 4;
  config.retry.backoff = Backoff{std::chrono::milliseconds(1),
                                 std::chrono::milliseconds(2)};
  config.infra_retry.backoff = Backoff{std::chrono::milliseconds(1),
                                       std::chrono::milliseconds(2)};
  if (!root.empty()) {
    config.orchestrator.data_root = (root / "data").string();
    config.orchestrator.logs_root = (root / "logs").string();
  }
  return config;
}

// ---- Pipeline builders --------------------------------------------------

[[nodiscard]] inline auto input(std::string name, std::string type = "")
    -> InputSpec {
  return InputSpec{.name = std::move(name), .type = std::move(type)};
}

[[nodiscard]] inline auto optional_input(std::string name) -> InputSpec {
  return InputSpec{.name = std::move(name), .optional = true};
}

[[nodiscard]] inline auto output(std::string name, std::string type = "")
    -> OutputSpec {
  return OutputSpec{.name = std::move(name), .type = std::move(type)};
}

[[nodiscard]] inline auto component(std::string name,
                                    std::vector<InputSpec> inputs,
                                    std::vector<OutputSpec> outputs)
    -> ComponentSpec {
  ComponentSpec c;
  c.name = std::move(name);
  c.inputs = std::move(inputs);
  c.outputs = std::move(outputs);
  c.container.image = "busybox";
  c.container.command = {CommandArgument::literal("true")};
  return c;
}

[[nodiscard]] inline auto ref(std::string_view task, std::string port)
    -> TaskOutputArgument {
  return TaskOutputArgument{.task_id = task_id(task),
                            .output_name = std::move(port)};
}

[[nodiscard]] inline auto from(std::string_view task, std::string port)
    -> ArgumentSource {
  return ref(task, std::move(port));
}

[[nodiscard]] inline auto constant(std::string value) -> ArgumentSource {
  return ConstantArgument{std::move(value)};
}

[[nodiscard]] inline auto graph_input(std::string name) -> ArgumentSource {
  return GraphInputArgument{std::move(name)};
}

[[nodiscard]] inline auto task(std::string_view id, std::string component_name,
                               std::map<std::string, ArgumentSource> args = {})
    -> TaskSpec {
  TaskSpec t;
  t.id = task_id(id);
  t.component = std::move(component_name);
  t.arguments = std::move(args);
  return t;
}

// Generic components: "source" has one output, "step" one input and one
// output, "sink" one input and no outputs.
[[nodiscard]] inline auto basic_components() -> std::vector<ComponentSpec> {
  return {
      component("source", {}, {output("out")}),
      component("step", {input("in")}, {output("out")}),
      component("sink", {input("in")}, {}),
      component("join", {input("left"), input("right")}, {output("out")}),
  };
}

// A -> B -> C
[[nodiscard]] inline auto linear_pipeline() -> PipelineSpec {
  PipelineSpec p;
  p.name = "linear";
  p.components = basic_components();
  p.tasks = {
      task("A", "source"),
      task("B", "step", {{"in", from("A", "out")}}),
      task("C", "step", {{"in", from("B", "out")}}),
  };
  return p;
}

// A -> {B, C} -> D
[[nodiscard]] inline auto diamond_pipeline() -> PipelineSpec {
  PipelineSpec p;
  p.name = "diamond";
  p.components = basic_components();
  p.tasks = {
      task("A", "source"),
      task("B", "step", {{"in", from("A", "out")}}),
      task("C", "step", {{"in", from("A", "out")}}),
      task("D", "join",
           {{"left", from("B", "out")}, {"right", from("C", "out")}}),
  };
  return p;
}

// ---- Scripted launcher --------------------------------------------------

enum class FakeOutcome {
  Succeed,        // completes successfully at the first poll
  Fail,           // completes with a nonzero exit code at the first poll
  Hold,           // stays running until released or cancelled
  LaunchFailure,  // launch() returns Error::LaunchFailure
  Unreachable,    // launch() returns Error::LauncherUnreachable
  OmitOutputs,    // succeeds but reports no artifacts
};

struct FakeStep {
  FakeOutcome outcome{FakeOutcome::Succeed};
  int exit_code{1};
  OutputArtifacts outputs;
};

// Launcher driven by per-task scripts. Each launch of a task consumes the
// next scripted step; unscripted launches succeed. Default artifacts carry
// the value "<task>.<port>".
class FakeLauncher final : public ILauncher {
public:
  auto script(std::string_view task, std::vector<FakeStep> steps) -> void {
    std::scoped_lock lock(mu_);
    auto& queue = scripts_[std::string(task)];
    for (auto& s : steps) {
      queue.push_back(std::move(s));
    }
  }

  auto script(std::string_view task, std::initializer_list<FakeOutcome> steps)
      -> void {
    std::vector<FakeStep> v;
    for (auto o : steps) {
      v.push_back(FakeStep{.outcome = o});
    }
    script(task, std::move(v));
  }

  [[nodiscard]] auto launch(const LaunchSpec& spec)
      -> Result<LaunchHandle> override {
    std::scoped_lock lock(mu_);
    auto name = spec.task_id.str();
    ++launch_attempts_[name];

    FakeStep step;
    if (auto& queue = scripts_[name]; !queue.empty()) {
      step = std::move(queue.front());
      queue.pop_front();
    }
    if (step.outcome == FakeOutcome::LaunchFailure) {
      return fail(Error::LaunchFailure);
    }
    if (step.outcome == FakeOutcome::Unreachable) {
      return fail(Error::LauncherUnreachable);
    }

    auto handle = std::format("fake:{}", spec.execution_id);
    if (step.outputs.empty() && step.outcome != FakeOutcome::OmitOutputs) {
      for (const auto& [port, uri] : spec.output_uris) {
        step.outputs.emplace(
            port, ArtifactData{.value = std::format("{}.{}", name, port),
                               .uri = uri});
      }
    }
    entries_[handle] = Entry{.task = name, .step = std::move(step)};
    specs_[name] = spec;
    ++running_;
    max_running_ = std::max(max_running_, running_);
    return handle;
  }

  [[nodiscard]] auto poll(const LaunchHandle& handle)
      -> Result<LaunchStatus> override {
    std::scoped_lock lock(mu_);
    if (poll_unreachable_) {
      return fail(Error::LauncherUnreachable);
    }
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
      return LaunchStatus{.state = LaunchState::Unknown,
                          .error = "no such execution"};
    }
    auto& e = it->second;
    if (e.cancelled) {
      return LaunchStatus{.state = LaunchState::Failed, .error = "cancelled"};
    }
    if (e.step.outcome == FakeOutcome::Hold && !e.released) {
      return LaunchStatus{.state = LaunchState::Running};
    }
    finish(e);
    if (e.step.outcome == FakeOutcome::Fail) {
      return LaunchStatus{.state = LaunchState::Failed,
                          .exit_code = e.step.exit_code};
    }
    return LaunchStatus{.state = LaunchState::Succeeded,
                        .exit_code = 0,
                        .outputs = e.step.outputs};
  }

  [[nodiscard]] auto cancel(const LaunchHandle& handle)
      -> Result<bool> override {
    std::scoped_lock lock(mu_);
    auto it = entries_.find(handle);
    if (it == entries_.end() || it->second.done) {
      return false;
    }
    it->second.cancelled = true;
    finish(it->second);
    cancelled_.push_back(it->second.task);
    return true;
  }

  auto subscribe(const std::shared_ptr<Notifier>& notifier) -> void override {
    notifiers_.add(notifier);
  }

  [[nodiscard]] auto subscribers() -> std::size_t {
    return notifiers_.size();
  }

  // Lets held executions of task complete successfully.
  auto release(std::string_view task) -> void {
    {
      std::scoped_lock lock(mu_);
      for (auto& [_, e] : entries_) {
        if (e.task == task) {
          e.released = true;
        }
      }
    }
    notifiers_.notify_all();
  }

  auto set_poll_unreachable(bool unreachable) -> void {
    std::scoped_lock lock(mu_);
    poll_unreachable_ = unreachable;
  }

  // Drops every execution, as a restarted launcher would.
  auto forget_all() -> void {
    std::scoped_lock lock(mu_);
    entries_.clear();
    running_ = 0;
  }

  [[nodiscard]] auto launch_attempts(std::string_view task) -> int {
    std::scoped_lock lock(mu_);
    auto it = launch_attempts_.find(std::string(task));
    return it != launch_attempts_.end() ? it->second : 0;
  }

  [[nodiscard]] auto launched(std::string_view task) -> bool {
    std::scoped_lock lock(mu_);
    return specs_.contains(std::string(task));
  }

  [[nodiscard]] auto last_spec(std::string_view task) -> LaunchSpec {
    std::scoped_lock lock(mu_);
    return specs_.at(std::string(task));
  }

  [[nodiscard]] auto cancelled() -> std::vector<std::string> {
    std::scoped_lock lock(mu_);
    return cancelled_;
  }

  [[nodiscard]] auto running() -> int {
    std::scoped_lock lock(mu_);
    return running_;
  }

  [[nodiscard]] auto max_running() -> int {
    std::scoped_lock lock(mu_);
    return max_running_;
  }

  [[nodiscard]] auto total_launches() -> int {
    std::scoped_lock lock(mu_);
    int n = 0;
    for (const auto& [_, count] : launch_attempts_) {
      n += count;
    }
    return n;
  }

private:
  struct Entry {
    std::string task;
    FakeStep step;
    bool released{false};
    bool cancelled{false};
    bool done{false};
  };

  auto finish(Entry& e) -> void {
    if (!e.done) {
      e.done = true;
      --running_;
    }
  }

  std::mutex mu_;
  std::unordered_map<std::string, std::deque<FakeStep>> scripts_;
  std::unordered_map<std::string, Entry> entries_;
  std::unordered_map<std::string, LaunchSpec> specs_;
  std::unordered_map<std::string, int> launch_attempts_;
  std::vector<std::string> cancelled_;
  NotifierSet notifiers_;
  bool poll_unreachable_{false};
  int running_{0};
  int max_running_{0};
};

// Polls pred until it holds or the timeout elapses.
template <typename Pred>
[[nodiscard]] auto wait_until(Pred pred,
                              std::chrono::milliseconds timeout =
                                  std::chrono::milliseconds(5000)) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

}  // namespace orchestra::test
