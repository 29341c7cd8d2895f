#pragma once

#include "orchestra/storage/run_state.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string_view>
#include <utility>

namespace orchestra {

namespace detail {

constexpr std::array<std::string_view, 5> kRunStatusNames = {
    "pending", "running", "succeeded", "failed", "cancelled",
};

constexpr std::array<std::string_view, 7> kTaskStatusNames = {
    "pending", "starting", "running", "succeeded",
    "failed",  "skipped",  "cancelled",
};

}  // namespace detail

[[nodiscard]] inline auto run_status_name(RunStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kRunStatusNames.size()
             ? detail::kRunStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_run_status(std::string_view name) noexcept
    -> RunStatus {
  auto it = std::ranges::find(detail::kRunStatusNames, name);
  if (it != detail::kRunStatusNames.end()) {
    return static_cast<RunStatus>(
        std::ranges::distance(detail::kRunStatusNames.begin(), it));
  }
  return RunStatus::Pending;
}

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size()
             ? detail::kTaskStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> TaskStatus {
  auto it = std::ranges::find(detail::kTaskStatusNames, name);
  if (it != detail::kTaskStatusNames.end()) {
    return static_cast<TaskStatus>(
        std::ranges::distance(detail::kTaskStatusNames.begin(), it));
  }
  return TaskStatus::Pending;
}

}  // namespace orchestra

template <>
struct std::formatter<orchestra::RunStatus> : std::formatter<std::string_view> {
  auto format(orchestra::RunStatus s, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        orchestra::run_status_name(s), ctx);
  }
};

template <>
struct std::formatter<orchestra::TaskStatus> : std::formatter<std::string_view> {
  auto format(orchestra::TaskStatus s, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        orchestra::task_status_name(s), ctx);
  }
};
