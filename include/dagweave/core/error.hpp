#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace dagweave {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  UnknownNode,
  CycleDetected,
  UnknownTask,
  InvalidDateRange,
  TaskExecutionFailed,
  CyclicParameter,
  ProcessSpawnFailed,
  Timeout,
  Cancelled,
  Unknown,
};

namespace detail {

class SchedulerErrorCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "dagweave";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Error>(ev)) {
    case Error::Success:
      return "success";
    case Error::FileNotFound:
      return "file not found";
    case Error::ParseError:
      return "parse error";
    case Error::InvalidArgument:
      return "invalid argument";
    case Error::UnknownNode:
      return "edge references an unknown node";
    case Error::CycleDetected:
      return "cycle detected in dependency graph";
    case Error::UnknownTask:
      return "scope filter references an unknown task";
    case Error::InvalidDateRange:
      return "invalid date range";
    case Error::TaskExecutionFailed:
      return "task execution failed";
    case Error::CyclicParameter:
      return "cyclic parameter reference";
    case Error::ProcessSpawnFailed:
      return "failed to spawn process";
    case Error::Timeout:
      return "timeout";
    case Error::Cancelled:
      return "cancelled";
    case Error::Unknown:
      break;
    }
    return "unknown error";
  }
};

} // namespace detail

[[nodiscard]] inline auto scheduler_category() noexcept
    -> const std::error_category & {
  static const detail::SchedulerErrorCategory category;
  return category;
}

[[nodiscard]] inline auto make_error_code(Error e) noexcept -> std::error_code {
  return {static_cast<int>(std::to_underlying(e)), scheduler_category()};
}

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return Result<std::decay_t<T>>(std::in_place, std::forward<T>(value));
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected<std::error_code>(ec);
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return fail(make_error_code(e));
}

} // namespace dagweave

template <> struct std::is_error_code_enum<dagweave::Error> : std::true_type {};
