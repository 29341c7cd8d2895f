#pragma once

#include "orchestra/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace orchestra::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() {
    buffer.reserve(4096);
  }
};

inline thread_local ThreadBuffer t_buffer;

// Async logger: producers format into a thread-local buffer and hand the line
// to a single writer thread through a bounded queue.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  BoundedMPSCQueue<std::string> queue_{kQueueCapacity};
  std::thread writer_;

  std::mutex sink_mu_;
  std::FILE* sink_{stdout};
  bool owns_sink_{false};

  auto write_line(std::string_view line) -> void {
    std::scoped_lock lock(sink_mu_);
    std::print(sink_, "{}", line);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < kBatchSize) {
        auto msg = queue_.try_pop();
        if (!msg) {
          break;
        }
        batch.push_back(std::move(*msg));
      }

      for (const auto& msg : batch) {
        write_line(msg);
      }
      if (batch.empty()) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      } else {
        std::scoped_lock lock(sink_mu_);
        std::fflush(sink_);
      }
    }

    // accepting_ is already false here, nothing new can arrive
    while (auto msg = queue_.try_pop()) {
      write_line(*msg);
    }
    std::scoped_lock lock(sink_mu_);
    std::fflush(sink_);
  }

  [[nodiscard]] auto colored() -> bool {
    std::scoped_lock lock(sink_mu_);
    return !owns_sink_;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    std::scoped_lock lock(sink_mu_);
    if (owns_sink_ && sink_) {
      std::fclose(sink_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true)) {
      return;
    }
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false)) {
      return;
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Redirects output to an append-mode file. Returns false if it cannot be
  // opened, in which case the current sink is kept.
  auto set_output_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
      return false;
    }
    std::scoped_lock lock(sink_mu_);
    if (owns_sink_ && sink_) {
      std::fclose(sink_);
    }
    sink_ = f;
    owns_sink_ = true;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }

    auto time =
        std::chrono::floor<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    bool color = colored();

    auto& buf = t_buffer.buffer;
    buf.clear();
    std::format_to(std::back_inserter(buf), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ",
                   time, color ? level_color(level) : "", level_name(level),
                   color ? "\033[0m" : "", tid);
    std::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    buf.push_back('\n');

    if (!accepting_.load(std::memory_order_acquire) ||
        !queue_.push(std::string(buf))) {
      write_line(buf);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  Level level = Level::Info;
  if (name == "trace")
    level = Level::Trace;
  else if (name == "debug")
    level = Level::Debug;
  else if (name == "warn")
    level = Level::Warn;
  else if (name == "error")
    level = Level::Error;
  logger().set_level(level);
}

inline auto set_output_file(const std::string& path) -> bool {
  return logger().set_output_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace orchestra::log
