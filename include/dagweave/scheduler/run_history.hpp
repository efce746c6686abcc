#pragma once

#include "dagweave/scheduler/task.hpp"
#include "dagweave/util/enum.hpp"
#include "dagweave/util/id.hpp"
#include "dagweave/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dagweave {

enum class RunState : std::uint8_t {
  Pending,
  Running,
  Success,
  Failed,
};
BOOST_DESCRIBE_ENUM(RunState, Pending, Running, Success, Failed)
DAGWEAVE_DEFINE_ENUM_SERDE(RunState, RunState::Pending)

struct RunScope {
  std::optional<TaskId> start_from;
  std::optional<TaskId> end_at;
  std::optional<std::vector<TaskId>> only_tasks;
};

struct TaskFailureEntry {
  TaskId task_id;
  std::string message;
};

struct ExecutionRecord {
  RunId run_id;
  std::string workflow_name;
  std::chrono::system_clock::time_point start_time;
  std::chrono::system_clock::time_point end_time;
  std::chrono::milliseconds duration{0};
  RunState status{RunState::Pending};
  std::map<std::string, std::string> params;
  RunScope scope;
  bool fail_fast{true};

  std::vector<TaskId> planned_tasks;
  std::vector<TaskId> completed_tasks;
  std::vector<TaskId> uncompleted_tasks;
  std::vector<std::pair<TaskId, TaskState>> task_states;

  // First failure of the run; later ones (non-fail-fast) are in task_failures.
  std::optional<TaskId> failed_task;
  std::string error_message;
  std::vector<TaskFailureEntry> task_failures;

  std::optional<std::chrono::sys_days> date_point;

  [[nodiscard]] auto state_of(const TaskId &task_id) const
      -> std::optional<TaskState>;
};

[[nodiscard]] auto to_json(const ExecutionRecord &record) -> JsonValue;

// Append-only, readable from any thread.
class RunHistory {
public:
  auto append(ExecutionRecord record) -> void;

  [[nodiscard]] auto snapshot() const -> std::vector<ExecutionRecord>;
  [[nodiscard]] auto last() const -> std::optional<ExecutionRecord>;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  mutable std::mutex mu_;
  std::vector<ExecutionRecord> records_;
};

} // namespace dagweave
