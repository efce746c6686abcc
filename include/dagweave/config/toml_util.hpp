#pragma once

#include "dagweave/core/error.hpp"
#include "dagweave/params/parameter_store.hpp"
#include "dagweave/util/log.hpp"

#include <glaze/toml.hpp>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

namespace dagweave::toml_util {

// Value of a `[params]` style table as glaze reads it. Integers arrive as
// double; to_param_map() narrows whole numbers back to int64.
using ParamTable =
    std::map<std::string, std::variant<std::string, double, bool>>;

[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  std::ifstream file{std::string(path), std::ios::in | std::ios::binary};
  if (!file.is_open()) {
    log::error("Cannot open '{}'", path);
    return fail(Error::FileNotFound);
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return ok(std::move(contents).str());
}

// Unknown keys are ignored. On failure the glaze error report goes to the log
// and, when given, to `diagnostic`.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr) -> Result<T> {
  static constexpr glz::opts kTomlOpts{.format = glz::TOML,
                                       .error_on_unknown_keys = false};
  T value{};
  if (const auto ec = glz::read<kTomlOpts>(value, text)) {
    std::string report = glz::format_error(ec, text);
    log::error("TOML parse error: {}", report);
    if (diagnostic != nullptr) {
      *diagnostic = std::move(report);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

namespace detail {

// Largest magnitude a double carries with every integer exact.
inline constexpr double kExactIntegerLimit = 9007199254740992.0;

struct ToParamValue {
  auto operator()(const std::string &s) const -> ParamValue { return s; }
  auto operator()(bool b) const -> ParamValue { return b; }
  auto operator()(double d) const -> ParamValue {
    if (std::abs(d) < kExactIntegerLimit && std::floor(d) == d) {
      return static_cast<std::int64_t>(d);
    }
    return d;
  }
};

} // namespace detail

[[nodiscard]] inline auto to_param_map(const ParamTable &table) -> ParamMap {
  ParamMap params;
  params.reserve(table.size());
  for (const auto &[name, raw] : table) {
    params.insert_or_assign(name, std::visit(detail::ToParamValue{}, raw));
  }
  return params;
}

} // namespace dagweave::toml_util
