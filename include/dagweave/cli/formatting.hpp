#pragma once

#include "dagweave/scheduler/run_history.hpp"
#include "dagweave/scheduler/task.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <vector>

namespace dagweave::cli::fmt {

// SGR parameter of each style.
enum class Style : std::uint8_t {
  Bold = 1,
  Dim = 2,
  Red = 31,
  Green = 32,
  Yellow = 33,
  Cyan = 36,
};

namespace ansi {

// Escapes are only emitted when stdout is a terminal.
[[nodiscard]] inline auto enabled() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  return tty;
}

[[nodiscard]] inline auto paint(std::string_view text, Style style)
    -> std::string {
  if (!enabled()) {
    return std::string(text);
  }
  return std::format("\033[{}m{}\033[0m", static_cast<int>(style), text);
}

[[nodiscard]] inline auto bold(std::string_view text) -> std::string {
  return paint(text, Style::Bold);
}
[[nodiscard]] inline auto dim(std::string_view text) -> std::string {
  return paint(text, Style::Dim);
}
[[nodiscard]] inline auto red(std::string_view text) -> std::string {
  return paint(text, Style::Red);
}
[[nodiscard]] inline auto green(std::string_view text) -> std::string {
  return paint(text, Style::Green);
}

// Printable width of `s`, skipping `ESC [ ... m` sequences.
[[nodiscard]] inline auto visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\033') {
      while (i < s.size() && s[i] != 'm') {
        ++i;
      }
      continue;
    }
    ++width;
  }
  return width;
}

} // namespace ansi

[[nodiscard]] inline auto paint_state(TaskState state) -> std::string {
  const auto name = to_string_view(state);
  switch (state) {
  case TaskState::Success:
    return ansi::paint(name, Style::Green);
  case TaskState::Failed:
    return ansi::paint(name, Style::Red);
  case TaskState::Running:
    return ansi::paint(name, Style::Yellow);
  case TaskState::Skipped:
    return ansi::paint(name, Style::Cyan);
  case TaskState::Pending:
    return ansi::paint(name, Style::Dim);
  }
  return std::string(name);
}

[[nodiscard]] inline auto paint_state(RunState state) -> std::string {
  const auto name = to_string_view(state);
  switch (state) {
  case RunState::Success:
    return ansi::paint(name, Style::Green);
  case RunState::Failed:
    return ansi::paint(name, Style::Red);
  case RunState::Running:
    return ansi::paint(name, Style::Yellow);
  case RunState::Pending:
    return ansi::paint(name, Style::Dim);
  }
  return std::string(name);
}

// Buffers rows and sizes every column to its widest cell on print().
class Table {
public:
  explicit Table(std::vector<std::string> headers)
      : headers_(std::move(headers)) {}

  auto add_row(std::vector<std::string> cells) -> void {
    cells.resize(headers_.size());
    rows_.emplace_back(std::move(cells));
  }

  auto print() const -> void {
    std::vector<std::size_t> widths(headers_.size());
    for (std::size_t c = 0; c < headers_.size(); ++c) {
      widths[c] = headers_[c].size();
      for (const auto &row : rows_) {
        widths[c] = std::max(widths[c], ansi::visible_width(row[c]));
      }
    }

    print_line(headers_, widths);
    std::size_t rule = 0;
    for (auto w : widths) {
      rule += w + 2;
    }
    std::println("{}", std::string(rule > 2 ? rule - 2 : rule, '-'));
    for (const auto &row : rows_) {
      print_line(row, widths);
    }
  }

private:
  static auto print_line(const std::vector<std::string> &cells,
                         const std::vector<std::size_t> &widths) -> void {
    std::string line;
    for (std::size_t c = 0; c < cells.size(); ++c) {
      line += cells[c];
      if (c + 1 < cells.size()) {
        line.append(widths[c] - ansi::visible_width(cells[c]) + 2, ' ');
      }
    }
    std::println("{}", line);
  }

  std::vector<std::string> headers_;
  std::vector<std::vector<std::string>> rows_;
};

[[nodiscard]] inline auto format_duration(std::chrono::milliseconds elapsed)
    -> std::string {
  using namespace std::chrono;
  if (elapsed < seconds{1}) {
    return std::format("{}ms", elapsed.count());
  }
  if (elapsed < minutes{1}) {
    return std::format("{:.1f}s", static_cast<double>(elapsed.count()) / 1000);
  }
  const auto h = duration_cast<hours>(elapsed);
  const auto m = duration_cast<minutes>(elapsed - h);
  const auto s = duration_cast<seconds>(elapsed - h - m);
  if (h.count() == 0) {
    return std::format("{}m {}s", m.count(), s.count());
  }
  return std::format("{}h {}m", h.count(), m.count());
}

} // namespace dagweave::cli::fmt
