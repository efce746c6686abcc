#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace dagweave::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

namespace detail {

struct LevelStyle {
  std::string_view name;
  std::string_view color;
};

[[nodiscard]] constexpr auto style_of(Level level) noexcept -> LevelStyle {
  switch (level) {
  case Level::Trace:
    return {"trace", "\033[90m"};
  case Level::Debug:
    return {"debug", "\033[36m"};
  case Level::Info:
    return {"info", "\033[32m"};
  case Level::Warn:
    return {"warn", "\033[33m"};
  case Level::Error:
    return {"error", "\033[31m"};
  case Level::Off:
    break;
  }
  return {"off", ""};
}

[[nodiscard]] inline auto level_from_name(std::string_view name) noexcept
    -> std::optional<Level> {
  for (auto l : {Level::Trace, Level::Debug, Level::Info, Level::Warn,
                 Level::Error, Level::Off}) {
    if (style_of(l).name == name) {
      return l;
    }
  }
  return std::nullopt;
}

// Formatting happens outside the sink lock; reuse one buffer per thread.
inline auto line_buffer() -> std::string & {
  thread_local std::string buf = [] {
    std::string s;
    s.reserve(512);
    return s;
  }();
  return buf;
}

} // namespace detail

// Process-wide synchronous sink. Engine workers log concurrently, so each
// line is written in one fwrite under the mutex.
class Logger {
public:
  Logger() = default;
  ~Logger() { close_file(); }

  Logger(const Logger &) = delete;
  auto operator=(const Logger &) -> Logger & = delete;

  auto set_level(Level level) noexcept -> void {
    threshold_.store(level, std::memory_order_relaxed);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return threshold_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level != Level::Off && level >= this->level();
  }

  auto set_output_stderr() noexcept -> void {
    std::lock_guard lock(mu_);
    sink_ = stderr;
  }

  // Appends to `path`; an empty path returns output to stdout.
  auto set_output_file(std::string_view path) -> bool {
    std::lock_guard lock(mu_);
    if (path.empty()) {
      close_file();
      sink_ = stdout;
      return true;
    }
    std::FILE *opened = std::fopen(std::string(path).c_str(), "a");
    if (opened == nullptr) {
      return false;
    }
    std::setvbuf(opened, nullptr, _IOLBF, 0);
    close_file();
    file_ = opened;
    sink_ = opened;
    return true;
  }

  template <typename... Args>
  auto write(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    const auto style = detail::style_of(level);
    const auto stamp = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    const auto thread =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;

    auto &line = detail::line_buffer();
    line.clear();
    std::format_to(std::back_inserter(line), "[{:%F %T}] [{}{}\033[0m] [{}] ",
                   stamp, style.color, style.name, thread);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');

    std::lock_guard lock(mu_);
    std::fwrite(line.data(), 1, line.size(), sink_);
    std::fflush(sink_);
  }

private:
  auto close_file() noexcept -> void {
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  std::atomic<Level> threshold_{Level::Info};
  std::mutex mu_;
  std::FILE *sink_{stdout};
  std::FILE *file_{nullptr};
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// Unknown names select Info.
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(detail::level_from_name(name).value_or(Level::Info));
}

[[nodiscard]] inline auto is_level_name(std::string_view name) noexcept
    -> bool {
  return detail::level_from_name(name).has_value();
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().write(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace dagweave::log
