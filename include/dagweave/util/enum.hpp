#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace dagweave {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

namespace util {

// "TaskExecutionFailed" -> "taskexecutionfailed", "task-kind" -> "taskkind".
[[nodiscard]] inline auto fold_enum_token(std::string_view token)
    -> std::string {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0) {
      out.push_back(static_cast<char>(std::tolower(uc)));
    }
  }
  return out;
}

// "DryRun" -> "dry_run"
[[nodiscard]] inline auto snake_case(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() + 4);
  char prev = '\0';
  for (char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isupper(uc) != 0 &&
        std::islower(static_cast<unsigned char>(prev)) != 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uc)));
    prev = c;
  }
  return out;
}

template <typename E> struct EnumEntry {
  E value{};
  std::string display;
  std::string key;
};

// One entry per described enumerator, built on first use.
template <typename E> [[nodiscard]] auto enum_entries() -> const auto & {
  using described = boost::describe::describe_enumerators<E>;
  static const auto entries = [] {
    std::array<EnumEntry<E>, boost::mp11::mp_size<described>::value> out{};
    std::size_t n = 0;
    boost::mp11::mp_for_each<described>([&](auto d) {
      out[n++] = EnumEntry<E>{d.value, snake_case(d.name),
                              fold_enum_token(d.name)};
    });
    return out;
  }();
  return entries;
}

template <typename E>
[[nodiscard]] auto enum_display_name(E value) noexcept -> std::string_view {
  for (const auto &entry : enum_entries<E>()) {
    if (entry.value == value) {
      return entry.display;
    }
  }
  return "unknown";
}

// Case and separator insensitive lookup.
template <typename E>
[[nodiscard]] auto find_enum(std::string_view text) -> std::optional<E> {
  const auto key = fold_enum_token(text);
  for (const auto &entry : enum_entries<E>()) {
    if (entry.key == key) {
      return entry.value;
    }
  }
  return std::nullopt;
}

template <typename E>
[[nodiscard]] auto is_enum_name(std::string_view text) -> bool {
  return find_enum<E>(text).has_value();
}

} // namespace util

// Declares to_string_view(E) and parse<E>() for a BOOST_DESCRIBE_ENUM type.
// parse<E> falls back to `Fallback` for unknown text.
#define DAGWEAVE_DEFINE_ENUM_SERDE(E, Fallback)                                \
  [[nodiscard]] inline auto to_string_view(E value) noexcept                   \
      -> std::string_view {                                                    \
    return ::dagweave::util::enum_display_name(value);                         \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<E>(std::string_view s) noexcept -> E {       \
    return ::dagweave::util::find_enum<E>(s).value_or(Fallback);               \
  }

} // namespace dagweave
