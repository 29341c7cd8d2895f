#pragma once

#include "orchestra/core/notifier.hpp"

#include <atomic>
#include <memory>

namespace orchestra {

class CancellationToken;

// Cancel flag for drive() and serve(). Waiters that registered a Notifier
// through their token are woken on cancel(), so a loop blocked in
// Notifier::wait_for reacts without waiting out its poll interval.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  // Only the first call wakes waiters. Not async-signal-safe; signal
  // handlers go through a watcher thread (see util/daemon.hpp).
  auto cancel() -> void {
    if (!state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
      state_->waiters.notify_all();
    }
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
    NotifierSet waiters;
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  // Subscribes notifier to the cancel. Notifies at once when the source is
  // already cancelled. A token from none() never fires.
  auto wake_on_cancel(const std::shared_ptr<Notifier>& notifier) const
      -> void {
    if (!state_ || !notifier) {
      return;
    }
    state_->waiters.add(notifier);
    if (is_cancelled()) {
      notifier->notify();
    }
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace orchestra
