#include "dagweave/alert/alert_sink.hpp"
#include "dagweave/cli/commands.hpp"
#include "dagweave/cli/formatting.hpp"
#include "dagweave/config/workflow_definition.hpp"
#include "dagweave/scheduler/engine.hpp"
#include "dagweave/util/json.hpp"
#include "dagweave/util/log.hpp"
#include "dagweave/util/time.hpp"

#include <memory>
#include <print>
#include <string>
#include <vector>

namespace dagweave::cli {

namespace {

auto print_record(const ExecutionRecord &record) -> void {
  std::println("{} {} ({})", fmt::ansi::bold("Run"), record.run_id,
               record.workflow_name);
  std::println("Started:  {}", util::format_local_timestamp(record.start_time));
  std::println("Duration: {}", fmt::format_duration(record.duration));
  std::println("");

  fmt::Table table({"TASK", "STATE", "ERROR"});
  for (const auto &[task_id, state] : record.task_states) {
    std::string error;
    for (const auto &failure : record.task_failures) {
      if (failure.task_id == task_id) {
        error = failure.message;
        break;
      }
    }
    table.add_row({task_id.str(), fmt::paint_state(state), error});
  }
  table.print();

  std::println("");
  std::println("Status: {} ({} completed, {} not completed)",
               fmt::paint_state(record.status), record.completed_tasks.size(),
               record.uncompleted_tasks.size());
  if (record.failed_task) {
    std::println("First failure: {}: {}", *record.failed_task,
                 fmt::ansi::red(record.error_message));
  } else if (!record.error_message.empty()) {
    std::println("Error: {}", fmt::ansi::red(record.error_message));
  }
}

} // namespace

auto cmd_run(const RunWorkflowOptions &opts) -> int {
  auto config = setup_logging(opts.global, /*apply_file_level=*/true);
  if (!config) {
    return 1;
  }

  std::string diagnostic;
  auto def = WorkflowLoader::load_from_file(opts.workflow_file, &diagnostic);
  if (!def) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? def.error().message() : diagnostic);
    return 1;
  }

  ParameterStore store;
  store.set(def->params);
  if (opts.params_file) {
    auto extra = load_params_file(*opts.params_file);
    if (!extra) {
      std::println(stderr, "Error: cannot load params '{}': {}",
                   *opts.params_file, extra.error().message());
      return 1;
    }
    store.set(*extra);
  }

  auto graph = def->build_graph();
  if (!graph) {
    std::println(stderr, "Error: {}", graph.error().message());
    return 1;
  }

  RunOptions run_opts{.fail_fast = def->fail_fast && !opts.no_fail_fast};
  if (opts.start_from) {
    run_opts.start_from = TaskId(*opts.start_from);
  }
  if (opts.end_at) {
    run_opts.end_at = TaskId(*opts.end_at);
  }
  if (!opts.only.empty()) {
    std::vector<TaskId> only;
    only.reserve(opts.only.size());
    for (const auto &id : opts.only) {
      only.emplace_back(id);
    }
    run_opts.only_tasks = std::move(only);
  }

  ExecutionEngine engine(
      EngineOptions{.workflow_name = def->name,
                    .max_parallelism = opts.parallelism.value_or(
                        config->scheduler.max_parallelism)},
      std::make_shared<LogAlertSink>());

  auto result = engine.execute(*graph, store, run_opts);
  auto record = engine.last_record();
  if (!record) {
    std::println(stderr, "Error: {}", result ? "no run recorded"
                                             : result.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", dump_json(to_json(*record)));
  } else {
    print_record(*record);
  }
  return result ? 0 : 1;
}

} // namespace dagweave::cli
