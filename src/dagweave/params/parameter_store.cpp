#include "dagweave/params/parameter_store.hpp"

#include "dagweave/params/date_expr.hpp"
#include "dagweave/util/log.hpp"
#include "dagweave/util/time.hpp"

#include <algorithm>
#include <format>
#include <type_traits>
#include <utility>
#include <variant>

namespace dagweave {

auto param_to_string(const ParamValue &value) -> std::string {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else {
          return std::format("{}", v);
        }
      },
      value);
}

ParameterStore::ParameterStore()
    : clock_([] { return std::chrono::system_clock::now(); }) {}

ParameterStore::ParameterStore(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

auto ParameterStore::set(const ParamMap &values) -> void {
  for (const auto &[name, value] : values) {
    values_.insert_or_assign(name, value);
  }
}

auto ParameterStore::set(std::string name, ParamValue value) -> void {
  values_.insert_or_assign(std::move(name), std::move(value));
}

auto ParameterStore::contains(std::string_view name) const -> bool {
  return values_.contains(name);
}

auto ParameterStore::get(std::string_view name) const
    -> std::optional<ParamValue> {
  auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ParameterStore::get(std::string_view name, ParamValue fallback) const
    -> ParamValue {
  auto it = values_.find(name);
  return it != values_.end() ? it->second : std::move(fallback);
}

auto ParameterStore::get_string(std::string_view name,
                                std::string_view fallback) const
    -> std::string {
  auto it = values_.find(name);
  return it != values_.end() ? param_to_string(it->second)
                             : std::string(fallback);
}

auto ParameterStore::now() const -> std::chrono::system_clock::time_point {
  return clock_();
}

auto ParameterStore::snapshot() const -> std::map<std::string, std::string> {
  std::map<std::string, std::string> out;
  for (const auto &[name, value] : values_) {
    out.emplace(name, param_to_string(value));
  }
  return out;
}

auto ParameterStore::resolve(std::string_view text) const
    -> Result<std::string> {
  std::vector<std::string> expanding;
  return resolve_impl(text, expanding);
}

auto ParameterStore::resolve_impl(std::string_view text,
                                  std::vector<std::string> &expanding) const
    -> Result<std::string> {
  std::string output;
  output.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    if (pos + 1 < text.size() && text[pos] == '$' && text[pos + 1] == '{') {
      auto close_pos = text.find('}', pos + 2);
      if (close_pos == std::string_view::npos) {
        output.append(text.substr(pos));
        break;
      }

      auto name = text.substr(pos + 2, close_pos - pos - 2);
      auto token = text.substr(pos, close_pos + 1 - pos);
      pos = close_pos + 1;

      if (name.empty()) {
        output.append(token);
        continue;
      }

      if (auto expr = parse_date_expr(name)) {
        // Date expressions count from today's local wall-clock date.
        output.append(
            evaluate_date_expr(*expr, util::to_local_civil(now())));
        continue;
      }

      auto it = values_.find(name);
      if (it == values_.end()) {
        output.append(token);
        continue;
      }

      const auto *nested_text = std::get_if<std::string>(&it->second);
      if (nested_text == nullptr) {
        output.append(param_to_string(it->second));
        continue;
      }

      if (std::ranges::find(expanding, name) != expanding.end() ||
          expanding.size() >= kMaxResolveDepth) {
        log::error("Cyclic parameter reference: '{}' (depth {})", name,
                   expanding.size());
        return fail(Error::CyclicParameter);
      }

      expanding.emplace_back(name);
      auto nested = resolve_impl(*nested_text, expanding);
      expanding.pop_back();
      if (!nested) {
        return fail(nested.error());
      }
      output.append(*nested);
      continue;
    }

    output.push_back(text[pos]);
    ++pos;
  }

  return ok(std::move(output));
}

} // namespace dagweave
