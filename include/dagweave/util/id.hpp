#pragma once

#include <ankerl/unordered_dense.h>

#include <cctype>
#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace dagweave {

// Non-empty and free of control characters.
[[nodiscard]] inline auto is_valid_id(std::string_view text) noexcept -> bool {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (std::iscntrl(static_cast<unsigned char>(c)) != 0) {
      return false;
    }
  }
  return true;
}

// String identifier tagged by what it names, so a run id cannot be passed
// where a task id is expected.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string text) : text_(std::move(text)) {}
  explicit TypedId(std::string_view text) : text_(text) {}
  explicit TypedId(const char *text) : text_(text == nullptr ? "" : text) {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return text_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return text_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return text_.empty(); }

  auto operator<=>(const TypedId &) const = default;
  auto operator==(const TypedId &) const -> bool = default;

  [[nodiscard]] auto operator==(std::string_view text) const noexcept
      -> bool {
    return text_ == text;
  }

  friend auto operator<<(std::ostream &os, const TypedId &id)
      -> std::ostream & {
    return os << id.text_;
  }

private:
  std::string text_;
};

struct TaskTag;
struct RunTag;

using TaskId = TypedId<TaskTag>;
using RunId = TypedId<RunTag>;

// Time-ordered: "<UTC yyyymmddTHHMMSS.mmm>-<8 hex digits>".
[[nodiscard]] auto generate_run_id() -> RunId;

} // namespace dagweave

template <typename Tag> struct std::hash<dagweave::TypedId<Tag>> {
  // Tells ankerl::unordered_dense not to mix the result again.
  using is_avalanching = void;

  [[nodiscard]] auto
  operator()(const dagweave::TypedId<Tag> &id) const noexcept -> std::size_t {
    return ankerl::unordered_dense::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<dagweave::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const dagweave::TypedId<Tag> &id,
              std::format_context &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
