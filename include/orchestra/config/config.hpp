#pragma once

#include "orchestra/core/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace orchestra {

enum class StorageEngine : std::uint8_t { Sqlite, Memory };

// What the controller does with the rest of a run once a required task has
// failed permanently.
enum class FailurePolicy : std::uint8_t {
  Continue,  // independent branches keep running
  Drain,     // no new dispatches, in-flight tasks finish
  Cancel,    // in-flight tasks are cancelled immediately
};

enum class LauncherMode : std::uint8_t { Local, Docker };

[[nodiscard]] auto to_string_view(StorageEngine e) noexcept -> std::string_view;
[[nodiscard]] auto to_string_view(FailurePolicy p) noexcept -> std::string_view;
[[nodiscard]] auto to_string_view(LauncherMode m) noexcept -> std::string_view;

[[nodiscard]] auto parse_storage_engine(std::string_view s) -> StorageEngine;
[[nodiscard]] auto parse_failure_policy(std::string_view s) -> FailurePolicy;
[[nodiscard]] auto parse_launcher_mode(std::string_view s) -> LauncherMode;

struct Backoff {
  std::chrono::milliseconds initial{1000};
  std::chrono::milliseconds max{60000};

  // initial * 2^(attempt-1), capped at max. attempt is 1-based.
  [[nodiscard]] auto delay(int attempt) const noexcept
      -> std::chrono::milliseconds;
};

struct StorageConfig {
  StorageEngine engine{StorageEngine::Sqlite};
  std::string db_file{"orchestra.db"};
  int busy_timeout_ms{5000};
};

struct OrchestratorSettings {
  std::string log_level{"info"};
  std::string log_file;
  std::chrono::milliseconds poll_interval{500};
  int max_in_flight_per_run{8};
  int max_in_flight_global{32};
  int dispatch_threads{4};
  FailurePolicy failure_policy{FailurePolicy::Continue};
  std::chrono::milliseconds claim_timeout{60000};
  std::string data_root{"./data"};
  std::string logs_root{"./logs"};
  nlohmann::json default_annotations = nlohmann::json::object();
};

struct RetryConfig {
  int max_retries{0};
  Backoff backoff{};
};

struct InfraRetryConfig {
  int max_attempts{10};
  Backoff backoff{std::chrono::milliseconds{1000},
                  std::chrono::milliseconds{30000}};
};

struct LauncherConfig {
  LauncherMode mode{LauncherMode::Local};
  std::string docker_binary{"docker"};
  std::string working_dir;
  // How long a finished execution stays pollable after its terminal status
  // was first reported or its cancel was reaped.
  std::chrono::milliseconds terminal_retention{60000};
};

struct Config {
  StorageConfig storage;
  OrchestratorSettings orchestrator;
  RetryConfig retry;
  InfraRetryConfig infra_retry;
  LauncherConfig launcher;
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<Config>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<Config>;
};

}  // namespace orchestra
