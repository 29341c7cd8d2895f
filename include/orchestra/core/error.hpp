#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace orchestra {

enum class Error : int {
  Success,
  FileNotFound,
  ParseError,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  Cancelled,
  // Graph validation family (rejected at submission)
  CycleDetected,
  DanglingReference,
  TypeMismatch,
  UnknownComponent,
  MissingArgument,
  DuplicateTask,
  // Execution family
  UnresolvedReference,
  LaunchFailure,
  LauncherUnreachable,
  StateStoreConflict,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "parse error",
      "database error",
      "failed to open database",
      "database query failed",
      "invalid argument",
      "not found",
      "already exists",
      "cancelled",
      "cycle detected in pipeline graph",
      "reference to a task or port that does not exist",
      "argument type does not match input type",
      "task references an unknown component",
      "required input has no argument",
      "duplicate task id",
      "unresolved input reference",
      "container launch failed",
      "launcher unreachable",
      "state store conflict",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "orchestra";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

// GraphValidationError: anything rejected before a run is created.
[[nodiscard]] inline auto is_graph_validation_error(std::error_code ec) noexcept
    -> bool {
  if (ec.category() != error_category()) {
    return false;
  }
  auto v = ec.value();
  return v >= std::to_underlying(Error::CycleDetected) &&
         v <= std::to_underlying(Error::DuplicateTask);
}

}  // namespace orchestra

template <>
struct std::is_error_code_enum<orchestra::Error> : std::true_type {};

namespace orchestra {

struct StringHash {
  using is_transparent = void;

  [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
    return std::hash<std::string_view>{}(sv);
  }

  [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }

  [[nodiscard]] std::size_t operator()(const char* s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace orchestra
