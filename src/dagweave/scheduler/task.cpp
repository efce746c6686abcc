#include "dagweave/scheduler/task.hpp"

#include "dagweave/util/log.hpp"

namespace dagweave {

auto TaskBase::set_param(std::string name, ParamValue value) -> void {
  resolved_.insert_or_assign(name, value);
  declared_.insert_or_assign(std::move(name), std::move(value));
}

auto TaskBase::get_param(std::string_view name) const
    -> std::optional<ParamValue> {
  if (auto it = resolved_.find(name); it != resolved_.end()) {
    return it->second;
  }
  if (auto it = declared_.find(name); it != declared_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto TaskBase::resolve_params(const ParameterStore &store) -> Result<void> {
  ParamMap resolved;
  resolved.reserve(declared_.size());
  for (const auto &[name, value] : declared_) {
    const auto *text = std::get_if<std::string>(&value);
    if (text == nullptr) {
      resolved.emplace(name, value);
      continue;
    }
    auto r = store.resolve(*text);
    if (!r) {
      log::error("Task '{}': failed to resolve param '{}': {}", id_, name,
                 r.error().message());
      return fail(r.error());
    }
    resolved.emplace(name, std::move(*r));
  }
  resolved_ = std::move(resolved);
  return ok();
}

} // namespace dagweave
