#include "dagweave/executor/shell_task.hpp"

#include "dagweave/executor/process_runner.hpp"
#include "dagweave/util/log.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/system/system_error.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace dagweave {

ShellTask::ShellTask(TaskId id, ShellTaskConfig config, ParamMap params)
    : TaskBase(std::move(id), std::move(params)), config_(std::move(config)),
      resolved_command_(config_.command) {}

auto ShellTask::resolve_params(const ParameterStore &store) -> Result<void> {
  if (auto r = TaskBase::resolve_params(store); !r) {
    return r;
  }

  ParameterStore scoped = store;
  scoped.set(resolved_);
  auto command = scoped.resolve(config_.command);
  if (!command) {
    return fail(command.error());
  }
  resolved_command_ = std::move(*command);
  return ok();
}

auto ShellTask::execute(const UpstreamResults & /*upstream*/) -> TaskResult {
  log::info("ShellTask '{}': timeout={}s cmd='{}'", id_,
            config_.timeout.count(), command_preview(resolved_command_));

  ProcessOutcome outcome;
  try {
    outcome = run_process("/bin/sh", {"-c", resolved_command_},
                          config_.working_dir, config_.timeout);
  } catch (const boost::system::system_error &e) {
    log::error("ShellTask '{}': spawn failed: {}", id_, e.what());
    return task_failed(make_error_code(Error::ProcessSpawnFailed), e.what());
  }

  if (outcome.timed_out) {
    return task_failed(
        make_error_code(Error::Timeout),
        std::format("shell command timed out after {}s",
                    config_.timeout.count()));
  }
  if (outcome.exit_code != 0) {
    return task_failed(std::format("shell command exited with code {}: {}",
                                   outcome.exit_code,
                                   boost::algorithm::trim_copy(
                                       outcome.stderr_output)));
  }

  return JsonValue{
      {"exit_code", static_cast<std::int64_t>(outcome.exit_code)},
      {"stdout", std::move(outcome.stdout_output)},
      {"stderr", std::move(outcome.stderr_output)},
  };
}

auto ShellTask::clone() const -> std::unique_ptr<ITask> {
  return std::make_unique<ShellTask>(id_, config_, declared_);
}

} // namespace dagweave
