#pragma once

#include "dagweave/scheduler/task.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace dagweave {

struct ShellTaskConfig {
  std::string command;
  std::string working_dir;
  // Zero disables the limit.
  std::chrono::seconds timeout{0};
};

// Runs `/bin/sh -c <command>`. `${name}` in the command is resolved against
// the task's own parameters first, then the run's parameter store.
// Result: {"exit_code": int, "stdout": str, "stderr": str}.
class ShellTask final : public TaskBase {
public:
  ShellTask(TaskId id, ShellTaskConfig config, ParamMap params = {});

  [[nodiscard]] auto kind() const noexcept -> TaskKind override {
    return TaskKind::Shell;
  }

  [[nodiscard]] auto resolve_params(const ParameterStore &store)
      -> Result<void> override;
  [[nodiscard]] auto execute(const UpstreamResults &upstream)
      -> TaskResult override;
  [[nodiscard]] auto clone() const -> std::unique_ptr<ITask> override;

  [[nodiscard]] auto config() const noexcept -> const ShellTaskConfig & {
    return config_;
  }
  [[nodiscard]] auto resolved_command() const noexcept -> const std::string & {
    return resolved_command_;
  }

private:
  ShellTaskConfig config_;
  std::string resolved_command_;
};

} // namespace dagweave
