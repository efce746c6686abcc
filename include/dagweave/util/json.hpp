#pragma once

#include <glaze/json.hpp>

#include <string>

namespace dagweave {

// Task outputs and `--json` CLI output. Integers stay int64.
using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  std::string buffer;
  if (const auto ec = glz::write_json(value, buffer); ec) {
    return "null";
  }
  return buffer;
}

} // namespace dagweave
