#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace conductor::log {

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

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// Async logger: callers format into a line and hand it to a writer thread.
// When the logger is stopped or the queue is full, lines are written inline.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  std::thread writer_;

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(BATCH_SIZE);

    while (true) {
      {
        std::unique_lock lock(mu_);
        cv_.wait(lock, [this] {
          return !queue_.empty() || !running_.load(std::memory_order_acquire);
        });
        if (queue_.empty() && !running_.load(std::memory_order_acquire)) {
          break;
        }
        while (!queue_.empty() && batch.size() < BATCH_SIZE) {
          batch.push_back(std::move(queue_.front()));
          queue_.pop_front();
        }
      }

      for (const auto& msg : batch) {
        std::fputs(msg.c_str(), stdout);
      }
      std::fflush(stdout);
      batch.clear();
    }
  }

  [[nodiscard]] static auto format_line(Level level, std::string_view body)
      -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                       level_color(level), level_name(level), "\033[0m", tid,
                       body);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
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
    {
      std::lock_guard lock(mu_);
      if (!running_.exchange(false)) {
        return;
      }
    }
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, fmt::format_string<Args...> format, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto line =
        format_line(level, fmt::format(format, std::forward<Args>(args)...));

    if (accepting_.load(std::memory_order_acquire)) {
      std::unique_lock lock(mu_);
      if (queue_.size() < QUEUE_CAPACITY) {
        queue_.push_back(std::move(line));
        lock.unlock();
        cv_.notify_one();
        return;
      }
    }
    std::fputs(line.c_str(), stdout);
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

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Trace, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(fmt::format_string<Args...> format, Args&&... args) -> void {
  logger().log(Level::Error, format, std::forward<Args>(args)...);
}

}  // namespace conductor::log
