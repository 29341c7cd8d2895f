#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace orchestra {

struct RunTag {};
struct TaskTag {};
struct ExecutionTag {};

// Phantom-typed string id; distinct tags do not convert into each other.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {
  }

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const -> const std::string& {
    return value_;
  }
  [[nodiscard]] auto c_str() const -> const char* {
    return value_.c_str();
  }

  [[nodiscard]] explicit operator std::string() const {
    return value_;
  }

  [[nodiscard]] auto empty() const -> bool {
    return value_.empty();
  }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs)
      -> bool = default;

private:
  std::string value_;
};

using RunId = TypedId<RunTag>;
using TaskId = TypedId<TaskTag>;
using ExecutionId = TypedId<ExecutionTag>;

namespace detail {

inline auto random_hex8() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}

// 12 hex digits of epoch milliseconds followed by 8 random hex digits, so ids
// sort by creation time.
inline auto time_ordered_id() -> std::string {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return std::format("{:012x}{}", static_cast<std::uint64_t>(ms) & 0xFFFFFFFFFFFFULL,
                     random_hex8());
}

}  // namespace detail

inline auto generate_run_id() -> RunId {
  return RunId{detail::time_ordered_id()};
}

inline auto generate_execution_id() -> ExecutionId {
  return ExecutionId{detail::time_ordered_id()};
}

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace orchestra

template <typename Tag>
struct std::hash<orchestra::TypedId<Tag>> {
  auto operator()(const orchestra::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<orchestra::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const orchestra::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
