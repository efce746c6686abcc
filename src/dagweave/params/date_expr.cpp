#include "dagweave/params/date_expr.hpp"

#include <boost/algorithm/string/replace.hpp>

#include <array>
#include <cctype>
#include <charconv>
#include <utility>

namespace dagweave {

namespace {

// Applied in order; every pass is case-sensitive.
constexpr std::array<std::pair<std::string_view, std::string_view>, 6>
    kFormatTable = {{
        {"yyyy", "%Y"},
        {"MM", "%m"},
        {"dd", "%d"},
        {"HH", "%H"},
        {"mm", "%M"},
        {"ss", "%S"},
    }};

[[nodiscard]] auto is_format_char(char c) noexcept -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '-';
}

} // namespace

auto parse_date_expr(std::string_view name) -> std::optional<DateExpr> {
  std::size_t digits_begin = name.size();
  while (digits_begin > 0 &&
         std::isdigit(static_cast<unsigned char>(name[digits_begin - 1])) !=
             0) {
    --digits_begin;
  }
  if (digits_begin == name.size() || digits_begin < 2) {
    return std::nullopt;
  }

  const char sign = name[digits_begin - 1];
  if (sign != '+' && sign != '-') {
    return std::nullopt;
  }

  const auto token = name.substr(0, digits_begin - 1);
  for (char c : token) {
    if (!is_format_char(c)) {
      return std::nullopt;
    }
  }

  int days = 0;
  const auto digits = name.substr(digits_begin);
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), days);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() ||
      days > DateExpr::kMaxOffsetDays) {
    return std::nullopt;
  }

  return DateExpr{.format_token = std::string(token),
                  .offset_days = sign == '-' ? -days : days};
}

auto to_strftime_pattern(std::string_view format_token) -> std::string {
  std::string pattern(format_token);
  for (const auto &[from, to] : kFormatTable) {
    boost::algorithm::replace_all(pattern, from, to);
  }
  return pattern;
}

auto evaluate_date_expr(const DateExpr &expr, const util::CivilTime &base)
    -> std::string {
  const util::CivilTime shifted{
      .day = base.day + std::chrono::days{expr.offset_days},
      .time_of_day = base.time_of_day};
  return util::format_civil(shifted, to_strftime_pattern(expr.format_token));
}

} // namespace dagweave
