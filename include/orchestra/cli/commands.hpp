#pragma once

#include "orchestra/config/config.hpp"
#include "orchestra/core/error.hpp"
#include "orchestra/storage/run_state.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace orchestra::cli {

struct CommonOptions {
  std::string config_file;
  std::string db_file;
};

struct ValidateOptions {
  std::string pipeline_file;
};

struct RunOptions {
  CommonOptions common;
  std::string pipeline_file;
  std::vector<std::string> inputs;
  std::string run_id;
  bool memory{false};
};

struct SubmitOptions {
  CommonOptions common;
  std::string pipeline_file;
  std::vector<std::string> inputs;
  std::string run_id;
};

struct ServeOptions {
  CommonOptions common;
  bool daemon{false};
  std::optional<std::string> log_file;
};

struct StatusOptions {
  CommonOptions common;
  std::string run_id;
};

struct CancelOptions {
  CommonOptions common;
  std::string run_id;
};

[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_submit(const SubmitOptions& opts) -> int;
[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_cancel(const CancelOptions& opts) -> int;

// Built-in defaults, then the config file, then --db.
[[nodiscard]] auto load_config(const CommonOptions& opts) -> Result<Config>;

auto print_run_state(const RunState& state) -> void;

// Tells a rejected pipeline (with its validation messages) apart from a
// store or I/O failure while creating the run.
auto print_submit_error(std::error_code ec,
                        const std::vector<std::string>& messages) -> void;

}  // namespace orchestra::cli
