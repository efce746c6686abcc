#pragma once

#include "dagweave/scheduler/task.hpp"

#include <functional>
#include <memory>

namespace dagweave {

struct TaskContext {
  const TaskId &task_id;
  const ParamMap &params;
  const UpstreamResults &upstream;
};

using TaskFn = std::function<TaskResult(const TaskContext &)>;

// In-process unit of work. The function sees the resolved task parameters and
// the results of its direct upstream tasks.
class CallableTask final : public TaskBase {
public:
  CallableTask(TaskId id, TaskFn fn, ParamMap params = {});

  [[nodiscard]] auto kind() const noexcept -> TaskKind override {
    return TaskKind::Callable;
  }

  [[nodiscard]] auto execute(const UpstreamResults &upstream)
      -> TaskResult override;
  [[nodiscard]] auto clone() const -> std::unique_ptr<ITask> override;

private:
  TaskFn fn_;
};

} // namespace dagweave
