#include "dagweave/executor/callable_task.hpp"

#include <utility>

namespace dagweave {

CallableTask::CallableTask(TaskId id, TaskFn fn, ParamMap params)
    : TaskBase(std::move(id), std::move(params)), fn_(std::move(fn)) {}

auto CallableTask::execute(const UpstreamResults &upstream) -> TaskResult {
  if (!fn_) {
    return task_failed(make_error_code(Error::InvalidArgument),
                       "callable task has no function");
  }
  return fn_(
      TaskContext{.task_id = id_, .params = resolved_, .upstream = upstream});
}

auto CallableTask::clone() const -> std::unique_ptr<ITask> {
  return std::make_unique<CallableTask>(id_, fn_, declared_);
}

} // namespace dagweave
