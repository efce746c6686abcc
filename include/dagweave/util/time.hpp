#pragma once

#include <charconv>
#include <chrono>
#include <ctime>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace dagweave::util {

using TimePoint = std::chrono::system_clock::time_point;

// "2024-01-31"
[[nodiscard]] inline auto format_day(std::chrono::sys_days day)
    -> std::string {
  return std::format("{:%F}", day);
}

// "2024-01-31T08:15:00Z"; the epoch formats as an empty string.
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp.time_since_epoch().count() == 0) {
    return {};
  }
  return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(tp));
}

// A wall-clock calendar date and time of day with no zone attached.
struct CivilTime {
  std::chrono::sys_days day{};
  std::chrono::seconds time_of_day{0};
};

// Breaks `tp` down in the process time zone (the TZ environment variable).
[[nodiscard]] inline auto to_local_civil(TimePoint tp) -> CivilTime {
  using namespace std::chrono;
  const std::time_t secs = system_clock::to_time_t(tp);
  std::tm fields{};
  ::localtime_r(&secs, &fields);
  const year_month_day ymd{year{fields.tm_year + 1900},
                           month{static_cast<unsigned>(fields.tm_mon + 1)},
                           day{static_cast<unsigned>(fields.tm_mday)}};
  return CivilTime{.day = sys_days{ymd},
                   .time_of_day = hours{fields.tm_hour} +
                                  minutes{fields.tm_min} +
                                  seconds{fields.tm_sec}};
}

// Applies a strftime(3) pattern to the fields of `t`. Zone conversions
// (%z, %Z) are not meaningful here.
[[nodiscard]] inline auto format_civil(const CivilTime &t,
                                       std::string_view pattern)
    -> std::string {
  using namespace std::chrono;
  if (pattern.empty()) {
    return {};
  }
  const year_month_day ymd{t.day};
  const hh_mm_ss hms{t.time_of_day};

  std::tm fields{};
  fields.tm_year = static_cast<int>(ymd.year()) - 1900;
  fields.tm_mon = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1;
  fields.tm_mday = static_cast<int>(static_cast<unsigned>(ymd.day()));
  fields.tm_hour = static_cast<int>(hms.hours().count());
  fields.tm_min = static_cast<int>(hms.minutes().count());
  fields.tm_sec = static_cast<int>(hms.seconds().count());
  fields.tm_wday = static_cast<int>(weekday{t.day}.c_encoding());
  fields.tm_yday =
      static_cast<int>((t.day - sys_days{ymd.year() / January / 1}).count());

  const std::string spec(pattern);
  std::string out(64 + pattern.size() * 4, '\0');
  const auto written =
      std::strftime(out.data(), out.size(), spec.c_str(), &fields);
  out.resize(written);
  return out;
}

// "2024-01-31 08:15:00" in the process time zone; the epoch formats as "-".
[[nodiscard]] inline auto format_local_timestamp(TimePoint tp) -> std::string {
  if (tp.time_since_epoch().count() == 0) {
    return "-";
  }
  return format_civil(to_local_civil(tp), "%Y-%m-%d %H:%M:%S");
}

// Strict YYYY-MM-DD (month and day may omit the leading zero).
[[nodiscard]] inline auto parse_day(std::string_view text)
    -> std::optional<std::chrono::sys_days> {
  const char *cur = text.data();
  const char *const end = text.data() + text.size();

  auto next_field = [&](auto &out, bool last) -> bool {
    const auto [ptr, ec] = std::from_chars(cur, end, out);
    if (ec != std::errc{} || ptr == cur) {
      return false;
    }
    cur = ptr;
    if (last) {
      return cur == end;
    }
    if (cur == end || *cur != '-') {
      return false;
    }
    ++cur;
    return true;
  };

  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  if (!next_field(y, false) || !next_field(m, false) || !next_field(d, true)) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{std::chrono::year{y},
                                        std::chrono::month{m},
                                        std::chrono::day{d}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return std::chrono::sys_days{ymd};
}

// "2024-01-31" -> "20240131"
[[nodiscard]] inline auto strip_dashes(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c != '-') {
      out += c;
    }
  }
  return out;
}

} // namespace dagweave::util
