#pragma once

#include "dagweave/core/error.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dagweave {

// Lets name-keyed maps be probed with a std::string_view.
struct NameHash {
  using is_transparent = void;
  using is_avalanching = void;

  [[nodiscard]] auto operator()(std::string_view name) const noexcept
      -> std::uint64_t {
    return ankerl::unordered_dense::hash<std::string_view>{}(name);
  }
};

template <typename V>
using NameMap =
    ankerl::unordered_dense::map<std::string, V, NameHash, std::equal_to<>>;

using ParamValue = std::variant<std::string, std::int64_t, double, bool>;
using ParamMap = NameMap<ParamValue>;

[[nodiscard]] auto param_to_string(const ParamValue &value) -> std::string;

class ParameterStore {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  // Nested `${...}` expansions allowed within a single resolve() call.
  static constexpr std::size_t kMaxResolveDepth = 64;

  ParameterStore();
  explicit ParameterStore(Clock clock);

  // Later keys overwrite earlier ones.
  auto set(const ParamMap &values) -> void;
  auto set(std::string name, ParamValue value) -> void;

  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  [[nodiscard]] auto get(std::string_view name) const
      -> std::optional<ParamValue>;
  [[nodiscard]] auto get(std::string_view name, ParamValue fallback) const
      -> ParamValue;
  [[nodiscard]] auto get_string(std::string_view name,
                                std::string_view fallback = {}) const
      -> std::string;

  // Replaces every `${name}` in `text`. Date expressions are evaluated against
  // the store clock, known keys are substituted (string values recursively),
  // anything else is left as written. Fails with Error::CyclicParameter when a
  // parameter chain refers back to itself.
  [[nodiscard]] auto resolve(std::string_view text) const
      -> Result<std::string>;

  [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point;
  [[nodiscard]] auto values() const noexcept -> const ParamMap & {
    return values_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return values_.size();
  }

  // Name-ordered, stringified copy of the raw values.
  [[nodiscard]] auto snapshot() const -> std::map<std::string, std::string>;

private:
  [[nodiscard]] auto resolve_impl(std::string_view text,
                                  std::vector<std::string> &expanding) const
      -> Result<std::string>;

  ParamMap values_;
  Clock clock_;
};

} // namespace dagweave
