#pragma once

#include "dagweave/util/time.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace dagweave {

// `<formatToken><+|-><days>`, e.g. `yyyy-MM-dd-1` or `yyyyMMdd+7`.
struct DateExpr {
  // About 270 years either way; larger offsets are not date expressions.
  static constexpr int kMaxOffsetDays = 100'000;

  std::string format_token;
  int offset_days{0};
};

// Matches the whole of `name`; the format token may only hold letters and
// hyphens, so `yyyy-MM-dd-1` splits at the last '-' before the digits.
[[nodiscard]] auto parse_date_expr(std::string_view name)
    -> std::optional<DateExpr>;

// yyyy->%Y, MM->%m, dd->%d, HH->%H, mm->%M, ss->%S
[[nodiscard]] auto to_strftime_pattern(std::string_view format_token)
    -> std::string;

// Shifts the calendar date of `base` by the offset; the time of day is kept.
[[nodiscard]] auto evaluate_date_expr(const DateExpr &expr,
                                      const util::CivilTime &base)
    -> std::string;

} // namespace dagweave
