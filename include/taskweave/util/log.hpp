#pragma once

#include "taskweave/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace taskweave::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn" || name == "warning")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  if (name == "off")
    return Level::Off;
  return Level::Info;
}

// Async logger: callers format into a string and push it onto a bounded
// MPSC queue; one writer thread drains it. Falls back to a synchronous write
// when the queue is full or the writer is not running.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  BoundedMPSCQueue<std::string> queue_{QUEUE_CAPACITY};
  std::thread writer_;
  std::mutex sink_mutex_;
  std::FILE* sink_{stderr};
  bool owns_sink_{false};

  auto write(std::string_view line) -> void {
    std::lock_guard lock(sink_mutex_);
    std::fwrite(line.data(), 1, line.size(), sink_);
  }

  auto flush() -> void {
    std::lock_guard lock(sink_mutex_);
    std::fflush(sink_);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(BATCH_SIZE);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < BATCH_SIZE) {
        auto msg = queue_.try_pop();
        if (!msg)
          break;
        batch.push_back(std::move(*msg));
      }

      for (const auto& msg : batch) {
        write(msg);
      }
      if (batch.empty()) {
        flush();
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    }

    // accepting_ is already false here, nothing new can arrive
    while (auto msg = queue_.try_pop()) {
      write(*msg);
    }
    flush();
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owns_sink_) {
      std::fclose(sink_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false))
      return;
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Redirects output to `path` (appending). Empty path restores stderr.
  auto set_file(const std::string& path) -> bool {
    std::FILE* next = stderr;
    if (!path.empty()) {
      next = std::fopen(path.c_str(), "a");
      if (next == nullptr)
        return false;
    }
    std::lock_guard lock(sink_mutex_);
    if (owns_sink_) {
      std::fclose(sink_);
    }
    sink_ = next;
    owns_sink_ = !path.empty();
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_.load(std::memory_order_acquire) &&
           level != Level::Off;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (!enabled(level))
      return;

    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    std::string line;
    line.reserve(256);
    std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] ",
                   now, level_name(level), tid);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');

    if (!accepting_.load(std::memory_order_acquire) || !queue_.push(line)) {
      write(line);
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
  logger().set_level(parse_level(name));
}

inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
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

}  // namespace taskweave::log
