#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace orchestra {

// Wakes a controller loop early when something it waits on changes.
class Notifier {
public:
  auto notify() -> void {
    {
      std::scoped_lock lock(mu_);
      pending_ = true;
    }
    cv_.notify_all();
  }

  // Returns true when a notification arrived before the timeout.
  auto wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(mu_);
    bool notified = cv_.wait_for(lock, timeout, [this] { return pending_; });
    pending_ = false;
    return notified;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool pending_{false};
};

// Fans one event out to every subscribed notifier still alive. Subscribers
// are held weakly, so a destroyed controller simply drops out.
class NotifierSet {
public:
  auto add(const std::shared_ptr<Notifier>& notifier) -> void {
    if (!notifier) {
      return;
    }
    std::scoped_lock lock(mu_);
    prune_locked();
    subscribers_.push_back(notifier);
  }

  auto notify_all() -> void {
    std::vector<std::shared_ptr<Notifier>> live;
    {
      std::scoped_lock lock(mu_);
      prune_locked();
      live.reserve(subscribers_.size());
      for (const auto& weak : subscribers_) {
        if (auto n = weak.lock()) {
          live.push_back(std::move(n));
        }
      }
    }
    for (const auto& n : live) {
      n->notify();
    }
  }

  [[nodiscard]] auto size() -> std::size_t {
    std::scoped_lock lock(mu_);
    prune_locked();
    return subscribers_.size();
  }

private:
  auto prune_locked() -> void {
    std::erase_if(subscribers_,
                  [](const std::weak_ptr<Notifier>& w) { return w.expired(); });
  }

  std::mutex mu_;
  std::vector<std::weak_ptr<Notifier>> subscribers_;
};

}  // namespace orchestra
