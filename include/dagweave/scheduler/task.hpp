#pragma once

#include "dagweave/core/error.hpp"
#include "dagweave/params/parameter_store.hpp"
#include "dagweave/util/enum.hpp"
#include "dagweave/util/id.hpp"
#include "dagweave/util/json.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <system_error>

namespace dagweave {

enum class TaskState : std::uint8_t {
  Pending,
  Running,
  Success,
  Failed,
  Skipped,
};
BOOST_DESCRIBE_ENUM(TaskState, Pending, Running, Success, Failed, Skipped)
DAGWEAVE_DEFINE_ENUM_SERDE(TaskState, TaskState::Pending)

[[nodiscard]] constexpr bool is_terminal(TaskState s) noexcept {
  return s == TaskState::Success || s == TaskState::Failed ||
         s == TaskState::Skipped;
}

enum class TaskKind : std::uint8_t {
  Shell,
  Callable,
  Sql,
};
BOOST_DESCRIBE_ENUM(TaskKind, Shell, Callable, Sql)
DAGWEAVE_DEFINE_ENUM_SERDE(TaskKind, TaskKind::Shell)

using UpstreamResults = ankerl::unordered_dense::map<TaskId, JsonValue>;

struct TaskFailure {
  std::error_code code{make_error_code(Error::TaskExecutionFailed)};
  std::string message;
};

using TaskResult = std::expected<JsonValue, TaskFailure>;

[[nodiscard]] inline auto task_failed(std::string message)
    -> std::unexpected<TaskFailure> {
  return std::unexpected{TaskFailure{.message = std::move(message)}};
}

[[nodiscard]] inline auto task_failed(std::error_code code,
                                      std::string message)
    -> std::unexpected<TaskFailure> {
  return std::unexpected{
      TaskFailure{.code = code, .message = std::move(message)}};
}

// Runnable unit bound to one graph node. The engine calls resolve_params()
// and then execute() once per run; nothing else.
class ITask {
public:
  virtual ~ITask() = default;

  [[nodiscard]] virtual auto id() const noexcept -> const TaskId & = 0;
  [[nodiscard]] virtual auto kind() const noexcept -> TaskKind = 0;

  // Must be idempotent for an unchanged store.
  [[nodiscard]] virtual auto resolve_params(const ParameterStore &store)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto execute(const UpstreamResults &upstream)
      -> TaskResult = 0;

  [[nodiscard]] virtual auto clone() const -> std::unique_ptr<ITask> = 0;
};

// Holds declared parameters and their resolved view. String values are
// re-resolved from the declared text on every resolve_params() call.
class TaskBase : public ITask {
public:
  explicit TaskBase(TaskId id, ParamMap params = {})
      : id_(std::move(id)), declared_(std::move(params)) {}

  [[nodiscard]] auto id() const noexcept -> const TaskId & override {
    return id_;
  }

  auto set_param(std::string name, ParamValue value) -> void;
  [[nodiscard]] auto get_param(std::string_view name) const
      -> std::optional<ParamValue>;

  [[nodiscard]] auto declared_params() const noexcept -> const ParamMap & {
    return declared_;
  }
  [[nodiscard]] auto params() const noexcept -> const ParamMap & {
    return resolved_;
  }

  [[nodiscard]] auto resolve_params(const ParameterStore &store)
      -> Result<void> override;

protected:
  TaskId id_;
  ParamMap declared_;
  ParamMap resolved_;
};

} // namespace dagweave
