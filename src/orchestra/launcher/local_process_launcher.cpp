#include "orchestra/launcher/local_process_launcher.hpp"

#include "orchestra/launcher/command_line.hpp"
#include "orchestra/util/log.hpp"
#include "orchestra/util/naming.hpp"

#include <nlohmann/json.hpp>

#include <sys/wait.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <set>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace orchestra {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

inline constexpr auto kReapInterval = std::chrono::milliseconds(20);
inline constexpr std::string_view kContainerInputsRoot = "/tmp/inputs";
inline constexpr std::string_view kContainerOutputsRoot = "/tmp/outputs";
inline constexpr std::string_view kStagedFileName = "data";

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto is_valid_utf8(std::string_view s) -> bool {
  std::size_t i = 0;
  while (i < s.size()) {
    auto c = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    if (c < 0x80) {
      len = 1;
    } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
      len = 2;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
    } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
      len = 4;
    } else {
      return false;
    }
    if (i + len > s.size()) {
      return false;
    }
    for (std::size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
        return false;
      }
    }
    i += len;
  }
  return true;
}

auto read_file(const fs::path& path, std::size_t max_size)
    -> Result<std::string> {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    log::warn("Artifact {} is not a readable file", path.string());
    return fail(Error::LaunchFailure);
  }
  auto size = fs::file_size(path, ec);
  if (ec || size > max_size) {
    log::warn("Artifact {} is too large to consume as a value", path.string());
    return fail(Error::LaunchFailure);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return std::string{std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>()};
}

auto write_file(const fs::path& path, std::string_view content)
    -> Result<void> {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    log::error("Failed to create {}: {}", path.parent_path().string(),
               ec.message());
    return fail(Error::LaunchFailure);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out) {
    log::error("Failed to write {}", path.string());
    return fail(Error::LaunchFailure);
  }
  return ok();
}

auto artifact_text(const ArtifactData& a) -> Result<std::string> {
  if (a.value) {
    return *a.value;
  }
  if (a.uri) {
    auto text = read_file(*a.uri, LocalProcessLauncher::kMaxInputValueSize);
    if (!text) {
      return fail(text.error());
    }
    if (!is_valid_utf8(*text)) {
      log::warn("Artifact {} is not valid UTF-8 text", *a.uri);
      return fail(Error::LaunchFailure);
    }
    return text;
  }
  return fail(Error::UnresolvedReference);
}

// Tracks host paths handed to the command and, in docker mode, the bind
// mounts that expose them inside the container.
class PathMapper {
public:
  explicit PathMapper(bool docker) : docker_(docker) {
  }

  auto expose(const fs::path& host, std::string_view container_root,
              const std::string& rel, bool read_only) -> std::string {
    if (!docker_) {
      return host.string();
    }
    std::error_code ec;
    auto abs_host = fs::absolute(host, ec);
    if (ec) {
      abs_host = host;
    }
    auto container_dir = std::format("{}/{}", container_root, rel);
    mounts_.push_back(std::format("{}:{}{}", abs_host.parent_path().string(),
                                  container_dir, read_only ? ":ro" : ""));
    return std::format("{}/{}", container_dir, abs_host.filename().string());
  }

  [[nodiscard]] auto mounts() const -> const std::vector<std::string>& {
    return mounts_;
  }

private:
  bool docker_;
  std::vector<std::string> mounts_;
};

auto build_env(const std::map<std::string, std::string>& overrides)
    -> std::vector<std::string> {
  std::vector<std::string> env;
  for (char** e = environ; e && *e; ++e) {
    std::string_view entry{*e};
    auto eq = entry.find('=');
    if (eq != std::string_view::npos &&
        overrides.contains(std::string(entry.substr(0, eq)))) {
      continue;
    }
    env.emplace_back(entry);
  }
  for (const auto& [k, v] : overrides) {
    env.push_back(std::format("{}={}", k, v));
  }
  return env;
}

auto to_cstrings(std::vector<std::string>& items) -> std::vector<char*> {
  std::vector<char*> out;
  out.reserve(items.size() + 1);
  for (auto& s : items) {
    out.push_back(s.data());
  }
  out.push_back(nullptr);
  return out;
}

// Everything in the child before exec is async-signal-safe.
auto fork_and_exec(std::vector<std::string> argv, std::vector<std::string> env,
                   const std::string& working_dir, int log_fd) -> pid_t {
  auto c_argv = to_cstrings(argv);
  auto c_env = to_cstrings(env);

  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    setpgid(0, 0);
    dup2(log_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      if (devnull != STDIN_FILENO) {
        close(devnull);
      }
    }
    if (!working_dir.empty() && chdir(working_dir.c_str()) < 0) {
      _exit(127);
    }
    execvpe(c_argv[0], c_argv.data(), c_env.data());
    _exit(127);
  }

  setpgid(pid, pid);
  return pid;
}

auto run_quiet(std::vector<std::string> argv) -> int {
  int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
  if (devnull < 0) {
    return -1;
  }
  pid_t pid = fork_and_exec(std::move(argv), build_env({}), "", devnull);
  close(devnull);
  if (pid < 0) {
    return -1;
  }
  int status = 0;
  if (waitpid(pid, &status, 0) < 0) {
    return -1;
  }
  return get_exit_code(status);
}

auto open_log(const std::string& log_uri) -> int {
  if (log_uri.empty()) {
    return open("/dev/null", O_WRONLY | O_CLOEXEC);
  }
  std::error_code ec;
  fs::create_directories(fs::path(log_uri).parent_path(), ec);
  return open(log_uri.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
}

}  // namespace

auto local_handle_execution_id(const LaunchHandle& handle)
    -> std::optional<std::string> {
  auto j = json::parse(handle, nullptr, false);
  if (j.is_discarded() || !j.is_object() ||
      j.value("launcher", std::string{}) != "local" ||
      !j.contains("execution_id") || !j["execution_id"].is_string()) {
    return std::nullopt;
  }
  return j["execution_id"].get<std::string>();
}

LocalProcessLauncher::LocalProcessLauncher(LauncherConfig config)
    : config_(std::move(config)),
      reaper_([this](std::stop_token stop) { reap_loop(stop); }) {
}

LocalProcessLauncher::~LocalProcessLauncher() {
  reaper_.request_stop();
  if (reaper_.joinable()) {
    reaper_.join();
  }

  std::scoped_lock lock(mu_);
  for (auto& [id, proc] : processes_) {
    if (proc.finished || proc.pid <= 0) {
      continue;
    }
    log::warn("Killing unfinished process {} for execution {}", proc.pid, id);
    kill(-proc.pid, SIGKILL);
    int status = 0;
    waitpid(proc.pid, &status, 0);
  }
}

auto LocalProcessLauncher::subscribe(const std::shared_ptr<Notifier>& notifier)
    -> void {
  notifiers_.add(notifier);
}

auto LocalProcessLauncher::tracked() -> std::size_t {
  std::scoped_lock lock(mu_);
  return processes_.size();
}

auto LocalProcessLauncher::launch(const LaunchSpec& spec)
    -> Result<LaunchHandle> {
  bool docker = config_.mode == LauncherMode::Docker;
  std::string execution_id =
      spec.execution_id.empty() ? generate_execution_id().str()
                                : spec.execution_id.str();
  fs::path staging{spec.staging_dir.empty()
                       ? (fs::temp_directory_path() / "orchestra" /
                          execution_id / "inputs")
                       : fs::path(spec.staging_dir)};

  PathMapper paths{docker};

  auto find_input = [&](std::string_view name) -> const InputValue* {
    auto it = spec.inputs.find(std::string(name));
    return it != spec.inputs.end() ? &it->second : nullptr;
  };

  PlaceholderResolver resolver;

  resolver.input_value = [&](std::string_view name) -> Result<std::string> {
    const auto* input = find_input(name);
    if (!input) {
      return fail(Error::UnresolvedReference);
    }
    if (const auto* single = std::get_if<ArtifactData>(input)) {
      return artifact_text(*single);
    }
    auto items = json::array();
    for (const auto& item : std::get<std::vector<ArtifactData>>(*input)) {
      auto text = artifact_text(item);
      if (!text) {
        return fail(text.error());
      }
      items.push_back(std::move(*text));
    }
    return items.dump();
  };

  auto stage = [&](const ArtifactData& a, const fs::path& dir,
                   const std::string& rel) -> Result<std::string> {
    if (a.uri) {
      return paths.expose(*a.uri, kContainerInputsRoot, rel, true);
    }
    if (!a.value) {
      return fail(Error::UnresolvedReference);
    }
    auto file = dir / kStagedFileName;
    if (auto r = write_file(file, *a.value); !r) {
      return fail(r.error());
    }
    return paths.expose(file, kContainerInputsRoot, rel, true);
  };

  resolver.input_path = [&](std::string_view name) -> Result<std::string> {
    const auto* input = find_input(name);
    if (!input) {
      return fail(Error::UnresolvedReference);
    }
    auto rel = util::sanitize_file_name(name);
    auto dir = staging / rel;
    if (const auto* single = std::get_if<ArtifactData>(input)) {
      return stage(*single, dir, rel);
    }
    // A fan-in consumed as a path is a JSON list of the item paths.
    auto items = json::array();
    const auto& list = std::get<std::vector<ArtifactData>>(*input);
    for (std::size_t i = 0; i < list.size(); ++i) {
      auto item_rel = std::format("{}/{}", rel, i);
      auto path = stage(list[i], dir / std::to_string(i), item_rel);
      if (!path) {
        return fail(path.error());
      }
      items.push_back(std::move(*path));
    }
    auto list_file = dir / kStagedFileName;
    if (auto r = write_file(list_file, items.dump()); !r) {
      return fail(r.error());
    }
    return paths.expose(list_file, kContainerInputsRoot, rel + "/list", true);
  };

  resolver.output_path = [&](std::string_view name) -> Result<std::string> {
    auto it = spec.output_uris.find(std::string(name));
    if (it == spec.output_uris.end()) {
      log::error("No output location planned for '{}'", name);
      return fail(Error::LaunchFailure);
    }
    return paths.expose(it->second, kContainerOutputsRoot,
                        util::sanitize_file_name(name), false);
  };

  std::set<std::string> provided;
  for (const auto& [name, _] : spec.inputs) {
    provided.insert(name);
  }

  auto resolved = resolve_command_line(spec.container, provided, resolver);
  if (!resolved) {
    log::error("Failed to resolve command line for {}/{}: {}", spec.run_id,
               spec.task_id, resolved.error().message());
    return fail(resolved.error() == make_error_code(Error::UnresolvedReference)
                    ? Error::UnresolvedReference
                    : Error::LaunchFailure);
  }

  for (const auto& [name, uri] : spec.output_uris) {
    std::error_code ec;
    fs::create_directories(fs::path(uri).parent_path(), ec);
    if (ec) {
      log::error("Failed to prepare output location {}: {}", uri, ec.message());
      return fail(Error::LaunchFailure);
    }
  }

  std::vector<std::string> argv;
  std::string container_name;
  if (docker) {
    container_name = std::format("orchestra-{}", execution_id);
    argv = {config_.docker_binary, "run", "--rm", "--name", container_name};
    for (const auto& mount : paths.mounts()) {
      argv.push_back("-v");
      argv.push_back(mount);
    }
    for (const auto& [k, v] : spec.container.env) {
      argv.push_back("-e");
      argv.push_back(std::format("{}={}", k, v));
    }
    auto it = resolved->command.begin();
    if (it != resolved->command.end()) {
      argv.push_back("--entrypoint");
      argv.push_back(*it++);
    }
    argv.push_back(spec.container.image);
    argv.insert(argv.end(), it, resolved->command.end());
    argv.insert(argv.end(), resolved->args.begin(), resolved->args.end());
  } else {
    argv = resolved->argv();
  }

  if (argv.empty() || argv.front().empty()) {
    log::error("Task {}/{} has an empty command line", spec.run_id,
               spec.task_id);
    return fail(Error::LaunchFailure);
  }

  int log_fd = open_log(spec.log_uri);
  if (log_fd < 0) {
    log::error("Failed to open log {}: {}", spec.log_uri, strerror(errno));
    return fail(Error::LaunchFailure);
  }

  auto env = docker ? build_env({}) : build_env(spec.container.env);

  std::scoped_lock lock(mu_);
  if (processes_.contains(execution_id)) {
    close(log_fd);
    log::error("Execution {} is already launched", execution_id);
    return fail(Error::LaunchFailure);
  }

  pid_t pid =
      fork_and_exec(std::move(argv), std::move(env), config_.working_dir, log_fd);
  close(log_fd);
  if (pid < 0) {
    log::error("Failed to fork for {}/{}: {}", spec.run_id, spec.task_id,
               strerror(errno));
    return fail(Error::LauncherUnreachable);
  }

  processes_.emplace(execution_id, Process{.pid = pid,
                                           .container_name = container_name,
                                           .output_uris = spec.output_uris});
  log::info("Launched {}/{} as pid {} (execution {})", spec.run_id,
            spec.task_id, pid, execution_id);

  json handle = {
      {"launcher", "local"},
      {"execution_id", execution_id},
      {"pid", pid},
  };
  if (docker) {
    handle["container"] = container_name;
  }
  return handle.dump();
}

auto LocalProcessLauncher::poll(const LaunchHandle& handle)
    -> Result<LaunchStatus> {
  auto execution_id = local_handle_execution_id(handle);
  if (!execution_id) {
    return LaunchStatus{.state = LaunchState::Unknown,
                        .error = "unrecognized launcher handle"};
  }

  Process proc;
  {
    std::scoped_lock lock(mu_);
    auto it = processes_.find(*execution_id);
    if (it == processes_.end()) {
      return LaunchStatus{.state = LaunchState::Unknown,
                          .error = "no such process"};
    }
    auto& tracked = it->second;
    if (tracked.finished && !tracked.expires_at) {
      tracked.expires_at =
          std::chrono::steady_clock::now() + config_.terminal_retention;
    }
    proc = tracked;
  }

  if (!proc.finished) {
    return LaunchStatus{.state = LaunchState::Running};
  }
  if (proc.cancelled) {
    return LaunchStatus{.state = LaunchState::Failed,
                        .exit_code = proc.exit_code,
                        .error = "cancelled"};
  }
  if (proc.exit_code != 0) {
    return LaunchStatus{
        .state = LaunchState::Failed,
        .exit_code = proc.exit_code,
        .error = std::format("process exited with code {}", proc.exit_code)};
  }
  return collect_outputs(proc);
}

auto LocalProcessLauncher::collect_outputs(const Process& proc) const
    -> LaunchStatus {
  LaunchStatus status{.state = LaunchState::Succeeded, .exit_code = 0};
  for (const auto& [name, uri] : proc.output_uris) {
    std::error_code ec;
    fs::path path{uri};
    if (!fs::exists(path, ec)) {
      return LaunchStatus{
          .state = LaunchState::Failed,
          .exit_code = proc.exit_code,
          .error = std::format("output '{}' was not written to {}", name, uri)};
    }

    ArtifactData artifact;
    artifact.uri = uri;
    if (fs::is_regular_file(path, ec) &&
        fs::file_size(path, ec) < kMaxPreloadSize && !ec) {
      if (auto text = read_file(path, kMaxPreloadSize);
          text && is_valid_utf8(*text)) {
        artifact.value = std::move(*text);
      }
    }
    status.outputs.emplace(name, std::move(artifact));
  }
  return status;
}

auto LocalProcessLauncher::cancel(const LaunchHandle& handle) -> Result<bool> {
  auto execution_id = local_handle_execution_id(handle);
  if (!execution_id) {
    return false;
  }

  std::string container_name;
  {
    std::scoped_lock lock(mu_);
    auto it = processes_.find(*execution_id);
    if (it == processes_.end() || it->second.finished) {
      return false;
    }
    auto& proc = it->second;
    proc.cancelled = true;
    if (proc.pid > 0) {
      kill(-proc.pid, SIGKILL);
    }
    container_name = proc.container_name;
    log::info("Cancelled process {} for execution {}", proc.pid,
              *execution_id);
  }

  // Killing the docker client does not stop the container.
  if (!container_name.empty()) {
    if (int rc = run_quiet({config_.docker_binary, "kill", container_name});
        rc != 0) {
      log::warn("docker kill {} exited with {}", container_name, rc);
    }
  }
  return true;
}

auto LocalProcessLauncher::reap_loop(std::stop_token stop) -> void {
  while (!stop.stop_requested()) {
    bool changed = false;
    {
      std::scoped_lock lock(mu_);
      auto now = std::chrono::steady_clock::now();
      std::erase_if(processes_, [&](const auto& entry) {
        const auto& proc = entry.second;
        if (proc.expires_at && *proc.expires_at <= now) {
          log::debug("Dropping finished execution {}", entry.first);
          return true;
        }
        return false;
      });
      for (auto& [id, proc] : processes_) {
        if (proc.finished) {
          continue;
        }
        int status = 0;
        pid_t r = waitpid(proc.pid, &status, WNOHANG);
        if (r == 0) {
          continue;
        }
        proc.finished = true;
        if (r < 0) {
          log::warn("waitpid failed for pid {}: {}", proc.pid, strerror(errno));
          proc.exit_code = -1;
        } else {
          proc.exit_code = get_exit_code(status);
        }
        // A cancelled execution is not polled again by its owner.
        if (proc.cancelled) {
          proc.expires_at = now + config_.terminal_retention;
        }
        log::debug("Execution {} exited with code {}", id, proc.exit_code);
        changed = true;
      }
    }
    if (changed) {
      notifiers_.notify_all();
    }
    std::this_thread::sleep_for(kReapInterval);
  }
}

}  // namespace orchestra
