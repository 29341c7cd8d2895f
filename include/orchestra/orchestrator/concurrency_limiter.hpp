#pragma once

#include "orchestra/util/id.hpp"

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace orchestra {

// Process-wide cap on in-flight tasks, shared by every controller of a
// process. Each run reports its in-flight count as read from the store, so
// the limiter holds no state that must survive a restart.
class ConcurrencyLimiter {
public:
  explicit ConcurrencyLimiter(std::size_t limit) : limit_(limit) {
  }

  // Records in_flight for run_id and returns how many of wanted may start.
  [[nodiscard]] auto reserve(const RunId& run_id, std::size_t in_flight,
                             std::size_t wanted) -> std::size_t {
    std::scoped_lock lock(mu_);
    usage_[run_id] = in_flight;
    auto used = total_locked();
    auto granted = used >= limit_ ? 0 : std::min(wanted, limit_ - used);
    usage_[run_id] += granted;
    return granted;
  }

  auto forget(const RunId& run_id) -> void {
    std::scoped_lock lock(mu_);
    usage_.erase(run_id);
  }

  [[nodiscard]] auto in_use() const -> std::size_t {
    std::scoped_lock lock(mu_);
    return total_locked();
  }

  [[nodiscard]] auto limit() const noexcept -> std::size_t {
    return limit_;
  }

private:
  [[nodiscard]] auto total_locked() const -> std::size_t {
    std::size_t total = 0;
    for (const auto& [_, n] : usage_) {
      total += n;
    }
    return total;
  }

  std::size_t limit_;
  mutable std::mutex mu_;
  std::unordered_map<RunId, std::size_t> usage_;
};

}  // namespace orchestra
