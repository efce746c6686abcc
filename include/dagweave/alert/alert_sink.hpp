#pragma once

#include "dagweave/util/id.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace dagweave {

struct WorkflowFailureAlert {
  std::string workflow_name;
  RunId run_id;
  std::chrono::system_clock::time_point start_time;
  std::optional<TaskId> failed_task;
  std::string error_message;
  std::vector<TaskId> completed_tasks;
  std::vector<TaskId> uncompleted_tasks;
  std::optional<std::chrono::sys_days> date_point;
};

class IAlertSink {
public:
  virtual ~IAlertSink() = default;
  virtual auto on_workflow_failed(const WorkflowFailureAlert &alert)
      -> void = 0;
};

class NullAlertSink final : public IAlertSink {
public:
  auto on_workflow_failed(const WorkflowFailureAlert &) -> void override {}
};

// Writes one error line per failed run through the process logger.
class LogAlertSink final : public IAlertSink {
public:
  auto on_workflow_failed(const WorkflowFailureAlert &alert) -> void override;
};

} // namespace dagweave
