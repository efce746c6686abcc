#include "dagweave/scheduler/run_history.hpp"

#include "dagweave/util/time.hpp"

#include <algorithm>

namespace dagweave {

namespace {

[[nodiscard]] auto ids_to_json(const std::vector<TaskId> &ids) -> JsonValue {
  JsonValue arr = std::vector<JsonValue>{};
  for (const auto &id : ids) {
    arr.get_array().emplace_back(id.str());
  }
  return arr;
}

} // namespace

auto ExecutionRecord::state_of(const TaskId &task_id) const
    -> std::optional<TaskState> {
  auto it = std::ranges::find(task_states, task_id,
                              &std::pair<TaskId, TaskState>::first);
  if (it == task_states.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto to_json(const ExecutionRecord &record) -> JsonValue {
  JsonValue params = JsonValue::object_t{};
  for (const auto &[name, value] : record.params) {
    params.get_object().emplace(name, value);
  }

  JsonValue states = JsonValue::object_t{};
  for (const auto &[task_id, state] : record.task_states) {
    states.get_object().emplace(task_id.str(),
                                std::string(to_string_view(state)));
  }

  JsonValue failures = std::vector<JsonValue>{};
  for (const auto &f : record.task_failures) {
    failures.get_array().emplace_back(JsonValue{
        {"task_id", f.task_id.str()},
        {"message", f.message},
    });
  }

  JsonValue scope = JsonValue::object_t{};
  if (record.scope.start_from) {
    scope.get_object().emplace("start_from", record.scope.start_from->str());
  }
  if (record.scope.end_at) {
    scope.get_object().emplace("end_at", record.scope.end_at->str());
  }
  if (record.scope.only_tasks) {
    scope.get_object().emplace("only_tasks",
                               ids_to_json(*record.scope.only_tasks));
  }

  JsonValue out{
      {"run_id", record.run_id.str()},
      {"workflow", record.workflow_name},
      {"status", std::string(to_string_view(record.status))},
      {"start_time", util::format_iso8601(record.start_time)},
      {"end_time", util::format_iso8601(record.end_time)},
      {"duration_ms", static_cast<std::int64_t>(record.duration.count())},
      {"fail_fast", record.fail_fast},
      {"params", std::move(params)},
      {"scope", std::move(scope)},
      {"completed_tasks", ids_to_json(record.completed_tasks)},
      {"uncompleted_tasks", ids_to_json(record.uncompleted_tasks)},
      {"task_states", std::move(states)},
      {"task_failures", std::move(failures)},
  };
  if (record.failed_task) {
    out.get_object().emplace("failed_task", record.failed_task->str());
    out.get_object().emplace("error", record.error_message);
  } else if (!record.error_message.empty()) {
    out.get_object().emplace("error", record.error_message);
  }
  if (record.date_point) {
    out.get_object().emplace("date_point",
                             util::format_day(*record.date_point));
  }
  return out;
}

auto RunHistory::append(ExecutionRecord record) -> void {
  std::scoped_lock lock(mu_);
  records_.emplace_back(std::move(record));
}

auto RunHistory::snapshot() const -> std::vector<ExecutionRecord> {
  std::scoped_lock lock(mu_);
  return records_;
}

auto RunHistory::last() const -> std::optional<ExecutionRecord> {
  std::scoped_lock lock(mu_);
  if (records_.empty()) {
    return std::nullopt;
  }
  return records_.back();
}

auto RunHistory::size() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return records_.size();
}

} // namespace dagweave
