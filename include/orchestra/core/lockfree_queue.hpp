#pragma once

#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>
#include <thread>

namespace orchestra {

inline constexpr std::size_t kCacheLineSize =
#ifdef __cpp_lib_hardware_interference_size
    std::hardware_destructive_interference_size;
#else
    64;
#endif

template <typename T>
concept QueueElement = std::movable<T> && std::destructible<T>;

// Bounded multi-producer queue (Vyukov sequence slots). try_pop must only be
// called by one consumer at a time.
template <QueueElement T>
class BoundedMPSCQueue {
public:
  explicit BoundedMPSCQueue(std::size_t capacity)
      : capacity_(std::bit_ceil(capacity < 2 ? std::size_t{2} : capacity)),
        mask_(capacity_ - 1),
        cells_(std::make_unique<Cell[]>(capacity_)) {
    for (std::size_t i = 0; i < capacity_; ++i) {
      cells_[i].sequence.store(i, std::memory_order_relaxed);
    }
  }

  ~BoundedMPSCQueue() {
    while (try_pop().has_value()) {
    }
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue(BoundedMPSCQueue&&) = delete;
  BoundedMPSCQueue& operator=(BoundedMPSCQueue&&) = delete;

  [[nodiscard]] auto push(T value) noexcept -> bool {
    auto pos = enqueue_pos_.load(std::memory_order_relaxed);
    for (;;) {
      auto& cell = cells_[pos & mask_];
      auto seq = cell.sequence.load(std::memory_order_acquire);
      auto lag =
          static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos);

      if (lag == 0) {
        if (enqueue_pos_.compare_exchange_weak(pos, pos + 1,
                                               std::memory_order_acq_rel,
                                               std::memory_order_relaxed)) {
          std::construct_at(cell.value(), std::move(value));
          cell.sequence.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (lag < 0) {
        return false;  // full
      } else {
        pos = enqueue_pos_.load(std::memory_order_relaxed);
      }
    }
  }

  auto push_blocking(T value) noexcept -> void {
    while (!push(std::move(value))) {
      std::this_thread::yield();
    }
  }

  [[nodiscard]] auto try_pop() noexcept -> std::optional<T> {
    auto pos = dequeue_pos_.load(std::memory_order_relaxed);
    auto& cell = cells_[pos & mask_];
    if (cell.sequence.load(std::memory_order_acquire) != pos + 1) {
      return std::nullopt;
    }
    T out = std::move(*cell.value());
    std::destroy_at(cell.value());
    cell.sequence.store(pos + capacity_, std::memory_order_release);
    dequeue_pos_.store(pos + 1, std::memory_order_relaxed);
    return out;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return enqueue_pos_.load(std::memory_order_acquire) ==
           dequeue_pos_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }

private:
  struct Cell {
    std::atomic<std::size_t> sequence;
    alignas(T) std::byte storage[sizeof(T)];

    auto value() noexcept -> T* {
      return std::launder(reinterpret_cast<T*>(storage));
    }
  };

  std::size_t capacity_;
  std::size_t mask_;
  std::unique_ptr<Cell[]> cells_;
  alignas(kCacheLineSize) std::atomic<std::size_t> enqueue_pos_{0};
  alignas(kCacheLineSize) std::atomic<std::size_t> dequeue_pos_{0};
};

}  // namespace orchestra
