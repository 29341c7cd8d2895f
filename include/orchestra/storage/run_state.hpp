#pragma once

#include "orchestra/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace orchestra {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

enum class RunStatus : std::uint8_t {
  Pending,
  Running,
  Succeeded,
  Failed,
  Cancelled,
};

enum class TaskStatus : std::uint8_t {
  Pending,
  Starting,
  Running,
  Succeeded,
  Failed,
  Skipped,
  Cancelled,
};

[[nodiscard]] constexpr auto is_terminal(RunStatus s) noexcept -> bool {
  return s == RunStatus::Succeeded || s == RunStatus::Failed ||
         s == RunStatus::Cancelled;
}

[[nodiscard]] constexpr auto is_terminal(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Succeeded || s == TaskStatus::Failed ||
         s == TaskStatus::Skipped || s == TaskStatus::Cancelled;
}

// In flight: claimed, the launcher may own a process for it.
[[nodiscard]] constexpr auto is_in_flight(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Starting || s == TaskStatus::Running;
}

// Opaque artifact reference: a location, a small inline value, or both.
struct ArtifactData {
  std::optional<std::string> value;
  std::optional<std::string> uri;

  [[nodiscard]] auto empty() const noexcept -> bool {
    return !value && !uri;
  }
  auto operator==(const ArtifactData&) const -> bool = default;
};

// A single artifact, or an ordered fan-in of artifacts.
using InputValue = std::variant<ArtifactData, std::vector<ArtifactData>>;
using ResolvedInputs = std::map<std::string, InputValue>;
using OutputArtifacts = std::map<std::string, ArtifactData>;

auto to_json(nlohmann::json& j, const ArtifactData& a) -> void;
auto from_json(const nlohmann::json& j, ArtifactData& a) -> void;

[[nodiscard]] auto inputs_to_json(const ResolvedInputs& inputs)
    -> nlohmann::json;
[[nodiscard]] auto inputs_from_json(const nlohmann::json& j) -> ResolvedInputs;

struct TaskAttempt {
  int attempt{0};
  ExecutionId execution_id;
  TaskStatus status{TaskStatus::Starting};
  std::string launcher_handle;
  std::optional<Timestamp> started_at;
  std::optional<Timestamp> finished_at;
  std::optional<int> exit_code;
  std::string error_message;
};

struct TaskExecution {
  RunId run_id;
  TaskId task_id;
  TaskStatus status{TaskStatus::Pending};
  // Number of claims so far; the current attempt when in flight.
  int attempt{0};
  int retry_count{0};
  int infra_retry_count{0};
  ExecutionId execution_id;
  std::string launcher_handle;
  ResolvedInputs inputs;
  OutputArtifacts outputs;
  std::string cache_key;
  std::optional<int> exit_code;
  std::string error_message;
  std::optional<Timestamp> next_attempt_at;
  std::optional<Timestamp> started_at;
  std::optional<Timestamp> finished_at;
  Timestamp updated_at{};
};

struct RunRecord {
  RunId id;
  std::string pipeline_name;
  std::string pipeline_spec;
  std::map<std::string, std::string> inputs;
  nlohmann::json annotations = nlohmann::json::object();
  RunStatus status{RunStatus::Pending};
  bool cancel_requested{false};
  Timestamp created_at{};
  std::optional<Timestamp> started_at;
  std::optional<Timestamp> finished_at;
};

// Snapshot of one run as read from the store.
struct RunState {
  RunRecord run;
  std::vector<TaskExecution> tasks;

  [[nodiscard]] auto find(const TaskId& id) const -> const TaskExecution*;
  [[nodiscard]] auto count(TaskStatus s) const -> std::size_t;
  [[nodiscard]] auto in_flight() const -> std::size_t;
};

struct NewRun {
  std::optional<RunId> id;
  std::string pipeline_name;
  std::string pipeline_spec;
  std::vector<TaskId> task_ids;
  std::map<std::string, std::string> inputs;
  nlohmann::json annotations = nlohmann::json::object();
};

// Conditional update of one task execution. Optional fields are written only
// when set. A move to Starting opens a new attempt (clears exit code, error
// and finish time); leaving Starting or Running closes it.
struct TaskTransition {
  TaskStatus expected{TaskStatus::Pending};
  TaskStatus next{TaskStatus::Pending};
  std::optional<int> attempt;
  std::optional<int> retry_count;
  std::optional<int> infra_retry_count;
  std::optional<ExecutionId> execution_id;
  std::optional<std::string> launcher_handle;
  std::optional<ResolvedInputs> inputs;
  std::optional<std::string> cache_key;
  std::optional<int> exit_code;
  std::optional<std::string> error_message;
  std::optional<Timestamp> next_attempt_at;
};

// Attempt-row status recorded when an attempt ends with the given task move.
[[nodiscard]] constexpr auto attempt_outcome(TaskStatus next) noexcept
    -> TaskStatus {
  return next == TaskStatus::Pending ? TaskStatus::Failed : next;
}

[[nodiscard]] inline auto to_timestamp(Timestamp tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_timestamp(std::int64_t ms) -> Timestamp {
  return Timestamp(std::chrono::milliseconds(ms));
}

}  // namespace orchestra
