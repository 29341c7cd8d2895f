#include "orchestra/config/config.hpp"

#include "orchestra/config/yaml_utils.hpp"
#include "orchestra/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<orchestra::Backoff> {
  static bool decode(const Node& node, orchestra::Backoff& b) {
    if (!node.IsMap()) {
      return false;
    }
    b.initial = orchestra::yaml_get_or(node, "backoff_initial_ms", b.initial);
    b.max = orchestra::yaml_get_or(node, "backoff_max_ms", b.max);
    return true;
  }
};

template <>
struct convert<orchestra::StorageConfig> {
  static bool decode(const Node& node, orchestra::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.engine = orchestra::parse_storage_engine(
        orchestra::yaml_get_or<std::string>(node, "engine", "sqlite"));
    s.db_file = orchestra::yaml_get_or<std::string>(node, "db_file", "orchestra.db");
    s.busy_timeout_ms = orchestra::yaml_get_or(node, "busy_timeout_ms", 5000);
    return true;
  }
};

template <>
struct convert<orchestra::OrchestratorSettings> {
  static bool decode(const Node& node, orchestra::OrchestratorSettings& o) {
    if (!node.IsMap()) {
      return false;
    }
    o.log_level = orchestra::yaml_get_or<std::string>(node, "log_level", "info");
    o.log_file = orchestra::yaml_get_or<std::string>(node, "log_file", "");
    o.poll_interval = orchestra::yaml_get_or(node, "poll_interval_ms", o.poll_interval);
    o.max_in_flight_per_run = orchestra::yaml_get_or(node, "max_in_flight_per_run", 8);
    o.max_in_flight_global = orchestra::yaml_get_or(node, "max_in_flight_global", 32);
    o.dispatch_threads = orchestra::yaml_get_or(node, "dispatch_threads", 4);
    o.failure_policy = orchestra::parse_failure_policy(
        orchestra::yaml_get_or<std::string>(node, "failure_policy", "continue"));
    o.claim_timeout = orchestra::yaml_get_or(node, "claim_timeout_ms", o.claim_timeout);
    o.data_root = orchestra::yaml_get_or<std::string>(node, "data_root", "./data");
    o.logs_root = orchestra::yaml_get_or<std::string>(node, "logs_root", "./logs");
    if (auto annotations = node["default_annotations"]; annotations && annotations.IsMap()) {
      o.default_annotations = orchestra::yaml_to_json(annotations);
    }
    return true;
  }
};

template <>
struct convert<orchestra::RetryConfig> {
  static bool decode(const Node& node, orchestra::RetryConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.max_retries = orchestra::yaml_get_or(node, "max_retries", 0);
    r.backoff = node.as<orchestra::Backoff>();
    return true;
  }
};

template <>
struct convert<orchestra::InfraRetryConfig> {
  static bool decode(const Node& node, orchestra::InfraRetryConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.max_attempts = orchestra::yaml_get_or(node, "max_attempts", 10);
    r.backoff.initial = orchestra::yaml_get_or(node, "backoff_initial_ms", r.backoff.initial);
    r.backoff.max = orchestra::yaml_get_or(node, "backoff_max_ms", r.backoff.max);
    return true;
  }
};

template <>
struct convert<orchestra::LauncherConfig> {
  static bool decode(const Node& node, orchestra::LauncherConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.mode = orchestra::parse_launcher_mode(
        orchestra::yaml_get_or<std::string>(node, "mode", "local"));
    l.docker_binary = orchestra::yaml_get_or<std::string>(node, "docker_binary", "docker");
    l.working_dir = orchestra::yaml_get_or<std::string>(node, "working_dir", "");
    l.terminal_retention =
        orchestra::yaml_get_or(node, "terminal_retention_ms", l.terminal_retention);
    return true;
  }
};

template <>
struct convert<orchestra::Config> {
  static bool decode(const Node& node, orchestra::Config& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<orchestra::StorageConfig>();
    }
    if (auto orchestrator = node["orchestrator"]) {
      c.orchestrator = orchestrator.as<orchestra::OrchestratorSettings>();
    }
    if (auto retry = node["retry"]) {
      c.retry = retry.as<orchestra::RetryConfig>();
    }
    if (auto infra = node["infra_retry"]) {
      c.infra_retry = infra.as<orchestra::InfraRetryConfig>();
    }
    if (auto launcher = node["launcher"]) {
      c.launcher = launcher.as<orchestra::LauncherConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace orchestra {

auto to_string_view(StorageEngine e) noexcept -> std::string_view {
  switch (e) {
    case StorageEngine::Sqlite: return "sqlite";
    case StorageEngine::Memory: return "memory";
  }
  return "sqlite";
}

auto to_string_view(FailurePolicy p) noexcept -> std::string_view {
  switch (p) {
    case FailurePolicy::Continue: return "continue";
    case FailurePolicy::Drain: return "drain";
    case FailurePolicy::Cancel: return "cancel";
  }
  return "continue";
}

auto to_string_view(LauncherMode m) noexcept -> std::string_view {
  switch (m) {
    case LauncherMode::Local: return "local";
    case LauncherMode::Docker: return "docker";
  }
  return "local";
}

auto parse_storage_engine(std::string_view s) -> StorageEngine {
  if (s == "sqlite") return StorageEngine::Sqlite;
  if (s == "memory") return StorageEngine::Memory;
  log::warn("Unknown storage engine '{}', using sqlite", s);
  return StorageEngine::Sqlite;
}

auto parse_failure_policy(std::string_view s) -> FailurePolicy {
  if (s == "continue") return FailurePolicy::Continue;
  if (s == "drain") return FailurePolicy::Drain;
  if (s == "cancel") return FailurePolicy::Cancel;
  log::warn("Unknown failure policy '{}', using continue", s);
  return FailurePolicy::Continue;
}

auto parse_launcher_mode(std::string_view s) -> LauncherMode {
  if (s == "local") return LauncherMode::Local;
  if (s == "docker") return LauncherMode::Docker;
  log::warn("Unknown launcher mode '{}', using local", s);
  return LauncherMode::Local;
}

auto Backoff::delay(int attempt) const noexcept -> std::chrono::milliseconds {
  if (attempt <= 1 || initial.count() <= 0) {
    return std::min(initial, max);
  }
  auto d = initial;
  for (int i = 1; i < attempt && d < max; ++i) {
    d *= 2;
  }
  return std::min(d, max);
}

auto ConfigLoader::load_from_file(std::string_view path) -> Result<Config> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<Config> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      // An empty file means all defaults.
      return ok(Config{});
    }
    if (!root.IsMap()) {
      log::error("Failed to parse config: expected a mapping");
      return fail(Error::ParseError);
    }
    Config config = root.as<Config>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace orchestra
