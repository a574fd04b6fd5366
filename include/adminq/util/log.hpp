#pragma once

#include "adminq/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <iterator>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

namespace adminq::log {

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

struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() {
    buffer.reserve(4096);
  }
};

inline thread_local ThreadBuffer t_buffer;

// Async logger: producers format on their own thread, one writer drains.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  BoundedMPSCQueue<std::string> queue_{QUEUE_CAPACITY};
  std::FILE* out_{stdout};
  bool owns_out_{false};
  bool colored_{true};
  std::thread writer_;

  auto write(std::string_view msg) -> void {
    std::print(out_, "{}", msg);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(BATCH_SIZE);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < BATCH_SIZE) {
        if (auto msg = queue_.try_pop()) {
          batch.push_back(std::move(*msg));
        } else {
          break;
        }
      }

      for (const auto& msg : batch) {
        write(msg);
      }
      if (batch.empty()) {
        std::fflush(out_);
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
    }

    // accepting_ is already false here, nothing new can arrive
    while (auto msg = queue_.try_pop()) {
      write(*msg);
    }
    std::fflush(out_);
  }

  auto format_line(std::string& buf, Level level, std::string_view body)
      -> void {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (colored_) {
      std::format_to(std::back_inserter(buf),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                     level_color(level), level_name(level), "\033[0m", tid,
                     body);
    } else {
      std::format_to(std::back_inserter(buf),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                     level_name(level), tid, body);
    }
  }

public:
  Logger() : colored_(::isatty(STDOUT_FILENO) != 0) {
  }

  ~Logger() {
    stop();
    if (owns_out_) {
      std::fclose(out_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Only honoured before start(); the writer thread owns the stream after.
  [[nodiscard]] auto set_output_file(const std::string& path) -> bool {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    if (owns_out_) {
      std::fclose(out_);
    }
    out_ = f;
    owns_out_ = true;
    colored_ = false;
    return true;
  }

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

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto& buf = t_buffer.buffer;
    buf.clear();
    format_line(buf, level, std::format(fmt, std::forward<Args>(args)...));

    // Synchronous path when stopped (tests, shutdown) or when the ring is full
    if (!accepting_.load(std::memory_order_acquire) ||
        !queue_.push(std::string(buf))) {
      write(buf);
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

[[nodiscard]] inline auto set_output_file(const std::string& path) -> bool {
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

}  // namespace adminq::log
