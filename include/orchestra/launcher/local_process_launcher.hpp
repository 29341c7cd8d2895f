#pragma once

#include "orchestra/config/config.hpp"
#include "orchestra/launcher/launcher.hpp"

#include <sys/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

namespace orchestra {

// Runs a component's command as a child process in its own process group,
// either directly or wrapped in `docker run --rm` with bind mounts. Artifact
// URIs are local filesystem paths. A reaper thread collects exit statuses;
// process state lives only in this object, so handles from an earlier
// process poll as Unknown. A finished execution is dropped
// terminal_retention after its outcome was first polled or its cancel was
// reaped, and polls as Unknown from then on.
class LocalProcessLauncher final : public ILauncher {
public:
  explicit LocalProcessLauncher(LauncherConfig config = {});
  ~LocalProcessLauncher() override;

  LocalProcessLauncher(const LocalProcessLauncher&) = delete;
  LocalProcessLauncher& operator=(const LocalProcessLauncher&) = delete;

  [[nodiscard]] auto launch(const LaunchSpec& spec)
      -> Result<LaunchHandle> override;
  [[nodiscard]] auto poll(const LaunchHandle& handle)
      -> Result<LaunchStatus> override;
  [[nodiscard]] auto cancel(const LaunchHandle& handle)
      -> Result<bool> override;
  auto subscribe(const std::shared_ptr<Notifier>& notifier) -> void override;

  // Executions still tracked, finished or not.
  [[nodiscard]] auto tracked() -> std::size_t;

  // Output values smaller than this are read back into the artifact.
  static constexpr std::size_t kMaxPreloadSize = 255;
  // Largest artifact that may be consumed through an inputValue placeholder.
  static constexpr std::size_t kMaxInputValueSize = 256 * 1024;

private:
  struct Process {
    pid_t pid{-1};
    std::string container_name;
    std::map<std::string, std::string> output_uris;
    bool finished{false};
    bool cancelled{false};
    int exit_code{-1};
    std::optional<std::chrono::steady_clock::time_point> expires_at;
  };

  auto reap_loop(std::stop_token stop) -> void;
  [[nodiscard]] auto collect_outputs(const Process& proc) const
      -> LaunchStatus;

  LauncherConfig config_;
  std::mutex mu_;
  std::unordered_map<std::string, Process, StringHash, StringEqual> processes_;
  NotifierSet notifiers_;
  std::jthread reaper_;
};

// Parses the execution id out of a handle written by LocalProcessLauncher.
[[nodiscard]] auto local_handle_execution_id(const LaunchHandle& handle)
    -> std::optional<std::string>;

}  // namespace orchestra
