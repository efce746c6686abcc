#include "dagweave/scheduler/engine.hpp"

#include "dagweave/util/log.hpp"
#include "dagweave/util/time.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <format>
#include <latch>
#include <mutex>
#include <utility>

namespace dagweave {

struct ExecutionEngine::RunContext {
  DAG &graph;
  const ParameterStore &store;
  const RunOptions &options;

  ExecutionRecord record;
  TaskIdSet scope;
  std::chrono::steady_clock::time_point started;

  std::mutex mu;
  ResultMap results;
  ankerl::unordered_dense::map<TaskId, TaskState> states;
  std::atomic<bool> aborted{false};
};

namespace {

// Releases a level barrier slot however the worker exits.
struct CountDownOnExit {
  std::latch &latch;
  ~CountDownOnExit() { latch.count_down(); }
};

// Parameter resolution and execution; any exception becomes a task failure.
auto invoke_task(ITask *task, const ParameterStore &store,
                 const UpstreamResults &upstream) -> TaskResult {
  if (task == nullptr) {
    return task_failed(make_error_code(Error::InvalidArgument),
                       "no runnable bound to task");
  }
  try {
    if (auto r = task->resolve_params(store); !r) {
      return task_failed(r.error(),
                         std::format("parameter resolution failed: {}",
                                     r.error().message()));
    }
    return task->execute(upstream);
  } catch (const std::exception &e) {
    return task_failed(e.what());
  } catch (...) {
    return task_failed("unknown exception");
  }
}

} // namespace

ExecutionEngine::ExecutionEngine(EngineOptions options,
                                 std::shared_ptr<IAlertSink> alerts)
    : options_(std::move(options)), alerts_(std::move(alerts)) {
  if (!alerts_) {
    alerts_ = std::make_shared<NullAlertSink>();
  }
  if (options_.max_parallelism == 0) {
    options_.max_parallelism = 1;
  }
  if (options_.max_parallelism > 1) {
    pool_ =
        std::make_unique<boost::asio::thread_pool>(options_.max_parallelism);
  }
}

ExecutionEngine::~ExecutionEngine() {
  if (pool_) {
    pool_->join();
  }
}

auto ExecutionEngine::compute_scope(const DAG &graph,
                                    const RunOptions &options) const
    -> Result<TaskIdSet> {
  TaskIdSet scope;

  if (options.only_tasks) {
    for (const auto &task_id : *options.only_tasks) {
      if (!graph.has_node(task_id)) {
        log::error("Run scope: unknown task '{}' in task subset", task_id);
        return fail(Error::UnknownTask);
      }
      scope.emplace(task_id);
    }
    return ok(std::move(scope));
  }

  for (const auto &task_id : graph.all_nodes()) {
    scope.emplace(task_id);
  }

  auto restrict_to = [&](const TaskId &anchor, TaskIdSet allowed) {
    allowed.emplace(anchor);
    TaskIdSet narrowed;
    for (const auto &task_id : scope) {
      if (allowed.contains(task_id)) {
        narrowed.emplace(task_id);
      }
    }
    scope = std::move(narrowed);
  };

  if (options.start_from) {
    if (!graph.has_node(*options.start_from)) {
      log::error("Run scope: unknown start task '{}'", *options.start_from);
      return fail(Error::UnknownTask);
    }
    restrict_to(*options.start_from,
                graph.downstream_closure(*options.start_from));
  }
  if (options.end_at) {
    if (!graph.has_node(*options.end_at)) {
      log::error("Run scope: unknown end task '{}'", *options.end_at);
      return fail(Error::UnknownTask);
    }
    restrict_to(*options.end_at, graph.upstream_closure(*options.end_at));
  }
  return ok(std::move(scope));
}

auto ExecutionEngine::execute(DAG &graph, const ParameterStore &store,
                              const RunOptions &options) -> Result<ResultMap> {
  RunContext ctx{.graph = graph, .store = store, .options = options};
  ctx.started = std::chrono::steady_clock::now();

  auto &record = ctx.record;
  record.run_id = generate_run_id();
  record.workflow_name = options_.workflow_name;
  record.start_time = std::chrono::system_clock::now();
  record.status = RunState::Running;
  record.params = store.snapshot();
  record.scope = RunScope{.start_from = options.start_from,
                          .end_at = options.end_at,
                          .only_tasks = options.only_tasks};
  record.fail_fast = options.fail_fast;
  record.date_point = options.date_point;

  log::info("Run {} of '{}' started{}", record.run_id, record.workflow_name,
            options.date_point
                ? std::format(" for {}", util::format_day(*options.date_point))
                : std::string{});

  auto levels = graph.levels();
  if (!levels) {
    record.error_message = levels.error().message();
    finish(ctx);
    return fail(levels.error());
  }

  auto scope = compute_scope(graph, options);
  if (!scope) {
    record.error_message = scope.error().message();
    finish(ctx);
    return fail(scope.error());
  }
  ctx.scope = std::move(*scope);

  std::vector<std::vector<TaskId>> scheduled;
  scheduled.reserve(levels->size());
  for (auto &level : *levels) {
    std::vector<TaskId> in_scope;
    for (auto &task_id : level) {
      if (ctx.scope.contains(task_id)) {
        record.planned_tasks.emplace_back(task_id);
        ctx.states.emplace(task_id, TaskState::Pending);
        in_scope.emplace_back(std::move(task_id));
      }
    }
    if (!in_scope.empty()) {
      scheduled.emplace_back(std::move(in_scope));
    }
  }

  for (std::size_t i = 0; i < scheduled.size(); ++i) {
    if (ctx.aborted.load(std::memory_order_acquire)) {
      break;
    }
    log::debug("Run {}: level {}/{} with {} task(s)", record.run_id, i + 1,
               scheduled.size(), scheduled[i].size());
    run_level(ctx, scheduled[i]);
  }

  finish(ctx);
  if (record.status == RunState::Failed) {
    return fail(Error::TaskExecutionFailed);
  }
  return ok(std::move(ctx.results));
}

auto ExecutionEngine::run_level(RunContext &ctx,
                                const std::vector<TaskId> &level) -> void {
  if (!pool_ || level.size() == 1) {
    for (const auto &task_id : level) {
      if (ctx.aborted.load(std::memory_order_acquire)) {
        break;
      }
      run_task(ctx, task_id);
    }
    return;
  }

  std::latch done(static_cast<std::ptrdiff_t>(level.size()));
  for (const auto &task_id : level) {
    boost::asio::post(*pool_, [this, &ctx, &done, &task_id] {
      const CountDownOnExit guard{done};
      try {
        run_task(ctx, task_id);
      } catch (const std::exception &e) {
        log::error("Task '{}': worker error: {}", task_id, e.what());
        record_result(ctx, task_id,
                      task_failed(std::format("worker error: {}", e.what())),
                      std::chrono::milliseconds{0});
      }
    });
  }
  done.wait();
}

auto ExecutionEngine::run_task(RunContext &ctx, const TaskId &task_id)
    -> void {
  // Fail-fast abort: tasks not yet started stay Pending and end up Skipped.
  if (ctx.aborted.load(std::memory_order_acquire)) {
    return;
  }

  ITask *task = ctx.graph.task(task_id);
  UpstreamResults upstream;
  {
    std::scoped_lock lock(ctx.mu);
    ctx.states[task_id] = TaskState::Running;
    for (const auto &dep : ctx.graph.direct_upstream_of(task_id)) {
      if (auto it = ctx.results.find(dep); it != ctx.results.end()) {
        upstream.emplace(dep, it->second);
      }
    }
  }

  log::info("Task '{}' started ({} upstream result(s))", task_id,
            upstream.size());
  const auto started = std::chrono::steady_clock::now();

  TaskResult result = invoke_task(task, ctx.store, upstream);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  record_result(ctx, task_id, std::move(result), elapsed);
}

auto ExecutionEngine::record_result(RunContext &ctx, const TaskId &task_id,
                                    TaskResult result,
                                    std::chrono::milliseconds elapsed)
    -> void {
  std::scoped_lock lock(ctx.mu);
  if (ctx.aborted.load(std::memory_order_acquire)) {
    log::warn("Task '{}' finished after the run was aborted; result discarded",
              task_id);
    ctx.states[task_id] = TaskState::Skipped;
    return;
  }

  if (result) {
    ctx.results.insert_or_assign(task_id, std::move(*result));
    ctx.record.completed_tasks.emplace_back(task_id);
    ctx.states[task_id] = TaskState::Success;
    log::info("Task '{}' succeeded in {}ms", task_id, elapsed.count());
    return;
  }

  ctx.states[task_id] = TaskState::Failed;
  ctx.record.task_failures.emplace_back(
      TaskFailureEntry{.task_id = task_id, .message = result.error().message});
  if (!ctx.record.failed_task) {
    ctx.record.failed_task = task_id;
    ctx.record.error_message = result.error().message;
  }
  log::error("Task '{}' failed after {}ms: {}", task_id, elapsed.count(),
             result.error().message);
  if (ctx.options.fail_fast) {
    ctx.aborted.store(true, std::memory_order_release);
  }
}

auto ExecutionEngine::finish(RunContext &ctx) -> void {
  auto &record = ctx.record;
  record.end_time = std::chrono::system_clock::now();
  record.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - ctx.started);

  TaskIdSet done(record.completed_tasks.begin(), record.completed_tasks.end());
  for (const auto &task_id : record.planned_tasks) {
    auto state = ctx.states[task_id];
    if (!is_terminal(state)) {
      state = TaskState::Skipped;
    }
    record.task_states.emplace_back(task_id, state);
    if (!done.contains(task_id) && record.failed_task != task_id) {
      record.uncompleted_tasks.emplace_back(task_id);
    }
  }

  const bool failed =
      record.failed_task.has_value() || !record.error_message.empty();
  record.status = failed ? RunState::Failed : RunState::Success;
  history_.append(record);

  if (failed) {
    log::error("Run {} of '{}' failed in {}ms: {} completed, {} not "
               "completed, first failure: {}",
               record.run_id, record.workflow_name, record.duration.count(),
               record.completed_tasks.size(), record.uncompleted_tasks.size(),
               record.error_message);
    alerts_->on_workflow_failed(WorkflowFailureAlert{
        .workflow_name = record.workflow_name,
        .run_id = record.run_id,
        .start_time = record.start_time,
        .failed_task = record.failed_task,
        .error_message = record.error_message,
        .completed_tasks = record.completed_tasks,
        .uncompleted_tasks = record.uncompleted_tasks,
        .date_point = record.date_point});
    return;
  }
  log::info("Run {} of '{}' succeeded in {}ms ({} task(s))", record.run_id,
            record.workflow_name, record.duration.count(),
            record.completed_tasks.size());
}

} // namespace dagweave
