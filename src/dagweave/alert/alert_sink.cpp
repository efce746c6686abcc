#include "dagweave/alert/alert_sink.hpp"

#include "dagweave/util/log.hpp"
#include "dagweave/util/time.hpp"

#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace dagweave {

namespace {

[[nodiscard]] auto join_sorted(const std::vector<TaskId> &ids) -> std::string {
  std::vector<std::string> names;
  names.reserve(ids.size());
  for (const auto &id : ids) {
    names.emplace_back(id.str());
  }
  std::ranges::sort(names);
  return names.empty() ? std::string{"-"} : boost::algorithm::join(names, ",");
}

} // namespace

auto LogAlertSink::on_workflow_failed(const WorkflowFailureAlert &alert)
    -> void {
  log::error("ALERT workflow='{}' run={} started={} date={} failed_task={} "
             "reason='{}' completed=[{}] uncompleted=[{}]",
             alert.workflow_name, alert.run_id,
             util::format_local_timestamp(alert.start_time),
             alert.date_point ? util::format_day(*alert.date_point) : "-",
             alert.failed_task ? alert.failed_task->str() : "-",
             alert.error_message, join_sorted(alert.completed_tasks),
             join_sorted(alert.uncompleted_tasks));
}

} // namespace dagweave
