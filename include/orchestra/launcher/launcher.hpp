#pragma once

#include "orchestra/core/error.hpp"
#include "orchestra/core/notifier.hpp"
#include "orchestra/graph/component.hpp"
#include "orchestra/storage/run_state.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace orchestra {

enum class LaunchState : std::uint8_t {
  Pending,
  Running,
  Succeeded,
  Failed,
  Unknown,
};

[[nodiscard]] constexpr auto to_string_view(LaunchState s) noexcept
    -> std::string_view {
  switch (s) {
    case LaunchState::Pending:
      return "pending";
    case LaunchState::Running:
      return "running";
    case LaunchState::Succeeded:
      return "succeeded";
    case LaunchState::Failed:
      return "failed";
    case LaunchState::Unknown:
      return "unknown";
  }
  return "unknown";
}

// Everything a launcher needs to start one attempt of a task.
struct LaunchSpec {
  RunId run_id;
  TaskId task_id;
  ExecutionId execution_id;
  ContainerSpec container;
  ResolvedInputs inputs;
  std::map<std::string, std::string> output_uris;
  std::string log_uri;
  // Directory for files staged from literal inputs consumed as paths.
  std::string staging_dir;
  nlohmann::json annotations = nlohmann::json::object();
};

// Opaque, persisted in the store as the execution's launcher handle.
using LaunchHandle = std::string;

struct LaunchStatus {
  LaunchState state{LaunchState::Unknown};
  std::optional<int> exit_code;
  OutputArtifacts outputs;
  std::string error;
};

// Capability interface for starting and observing containerized work.
//
// launch errors: Error::LaunchFailure for a per-attempt failure (counts
// against the retry budget), Error::LauncherUnreachable when the backend is
// down. poll reports LauncherUnreachable the same way; a handle the launcher
// does not know polls as LaunchState::Unknown.
class ILauncher {
public:
  virtual ~ILauncher() = default;

  [[nodiscard]] virtual auto launch(const LaunchSpec& spec)
      -> Result<LaunchHandle> = 0;
  [[nodiscard]] virtual auto poll(const LaunchHandle& handle)
      -> Result<LaunchStatus> = 0;
  // Best effort. Returns false when nothing was running for the handle.
  [[nodiscard]] virtual auto cancel(const LaunchHandle& handle)
      -> Result<bool> = 0;

  // Adds a notifier woken on any state change. Every subscriber stays
  // registered until it is destroyed; launchers without push events ignore
  // this and are only polled.
  virtual auto subscribe(const std::shared_ptr<Notifier>& notifier) -> void {
    (void)notifier;
  }
};

}  // namespace orchestra
