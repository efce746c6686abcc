#pragma once

#include "dagweave/alert/alert_sink.hpp"
#include "dagweave/core/error.hpp"
#include "dagweave/dag/dag.hpp"
#include "dagweave/params/parameter_store.hpp"
#include "dagweave/scheduler/run_history.hpp"
#include "dagweave/scheduler/task.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dagweave {

using ResultMap = ankerl::unordered_dense::map<TaskId, JsonValue>;

struct EngineOptions {
  std::string workflow_name{"workflow"};
  // 1 runs every level inline on the calling thread.
  std::size_t max_parallelism{1};
};

struct RunOptions {
  std::optional<TaskId> start_from;
  std::optional<TaskId> end_at;
  // Takes precedence over start_from/end_at when set.
  std::optional<std::vector<TaskId>> only_tasks;
  bool fail_fast{true};
  std::optional<std::chrono::sys_days> date_point;
};

class ExecutionEngine {
public:
  explicit ExecutionEngine(EngineOptions options = {},
                           std::shared_ptr<IAlertSink> alerts = nullptr);
  ~ExecutionEngine();

  ExecutionEngine(const ExecutionEngine &) = delete;
  ExecutionEngine &operator=(const ExecutionEngine &) = delete;

  // Runs the scoped part of `graph` level by level. Every call appends one
  // ExecutionRecord, including calls rejected for a cycle or an unknown
  // scope id. A task failure yields Error::TaskExecutionFailed after the
  // record is written.
  [[nodiscard]] auto execute(DAG &graph, const ParameterStore &store,
                             const RunOptions &options = {})
      -> Result<ResultMap>;

  [[nodiscard]] auto history() const -> std::vector<ExecutionRecord> {
    return history_.snapshot();
  }
  [[nodiscard]] auto last_record() const -> std::optional<ExecutionRecord> {
    return history_.last();
  }

  [[nodiscard]] auto options() const noexcept -> const EngineOptions & {
    return options_;
  }
  auto set_workflow_name(std::string name) -> void {
    options_.workflow_name = std::move(name);
  }

private:
  struct RunContext;

  [[nodiscard]] auto compute_scope(const DAG &graph,
                                   const RunOptions &options) const
      -> Result<TaskIdSet>;
  auto run_level(RunContext &ctx, const std::vector<TaskId> &level) -> void;
  auto run_task(RunContext &ctx, const TaskId &task_id) -> void;
  auto record_result(RunContext &ctx, const TaskId &task_id,
                     TaskResult result, std::chrono::milliseconds elapsed)
      -> void;
  auto finish(RunContext &ctx) -> void;

  EngineOptions options_;
  std::shared_ptr<IAlertSink> alerts_;
  std::unique_ptr<boost::asio::thread_pool> pool_;
  RunHistory history_;
};

} // namespace dagweave
