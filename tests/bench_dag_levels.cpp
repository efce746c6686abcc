// bench_dag_levels.cpp

#include "dagweave/dag/dag.hpp"
#include "dagweave/executor/callable_task.hpp"
#include "dagweave/params/parameter_store.hpp"
#include "dagweave/scheduler/engine.hpp"
#include "dagweave/util/log.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <vector>

namespace dagweave {
namespace {

class TaskIdPool {
public:
  explicit TaskIdPool(std::size_t count) {
    ids_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      ids_.emplace_back(std::format("t_{}", i));
    }
  }

  [[nodiscard]] auto at(std::size_t i) const -> const TaskId & {
    return ids_[i];
  }

private:
  std::vector<TaskId> ids_;
};

[[nodiscard]] auto make_linear_dag(const TaskIdPool &ids, std::size_t nodes)
    -> DAG {
  DAG dag;
  for (std::size_t i = 0; i < nodes; ++i) {
    if (!dag.add_node(ids.at(i))) {
      return dag;
    }
    if (i > 0) {
      if (!dag.add_edge(static_cast<NodeIndex>(i - 1),
                        static_cast<NodeIndex>(i))) {
        return dag;
      }
    }
  }
  return dag;
}

// width x depth grid; every node depends on every node of the previous layer.
[[nodiscard]] auto make_layered_dag(const TaskIdPool &ids, std::size_t width,
                                    std::size_t depth, bool with_tasks = false)
    -> DAG {
  DAG dag;
  for (std::size_t i = 0; i < width * depth; ++i) {
    if (with_tasks) {
      auto task = std::make_unique<CallableTask>(
          ids.at(i), [](const TaskContext &) -> TaskResult {
            return JsonValue{{"ok", true}};
          });
      if (!dag.add_task(std::move(task))) {
        return dag;
      }
    } else if (!dag.add_node(ids.at(i))) {
      return dag;
    }
  }
  for (std::size_t layer = 1; layer < depth; ++layer) {
    for (std::size_t to = 0; to < width; ++to) {
      for (std::size_t from = 0; from < width; ++from) {
        if (!dag.add_edge(
                static_cast<NodeIndex>((layer - 1) * width + from),
                static_cast<NodeIndex>(layer * width + to))) {
          return dag;
        }
      }
    }
  }
  return dag;
}

// ===================================================================
// BM_DagBuildLinear
// Measures: node and edge insertion for a chain.
// ===================================================================
void BM_DagBuildLinear(benchmark::State &state) {
  const auto nodes = static_cast<std::size_t>(state.range(0));
  TaskIdPool task_ids(nodes);

  for (auto _ : state) {
    auto dag = make_linear_dag(task_ids, nodes);
    benchmark::DoNotOptimize(dag);
  }
  state.SetItemsProcessed(static_cast<int64_t>(nodes) * state.iterations());
}

// ===================================================================
// BM_DagLevelsLinear
// Measures: Kahn waves on a chain (one node per level).
// ===================================================================
void BM_DagLevelsLinear(benchmark::State &state) {
  const auto nodes = static_cast<std::size_t>(state.range(0));
  TaskIdPool task_ids(nodes);
  auto dag = make_linear_dag(task_ids, nodes);

  for (auto _ : state) {
    auto levels = dag.levels();
    benchmark::DoNotOptimize(levels);
  }
  state.SetItemsProcessed(static_cast<int64_t>(nodes) * state.iterations());
}

// ===================================================================
// BM_DagLevelsLayered
// Measures: Kahn waves on a dense width x depth grid.
// ===================================================================
void BM_DagLevelsLayered(benchmark::State &state) {
  const auto width = static_cast<std::size_t>(state.range(0));
  const auto depth = static_cast<std::size_t>(state.range(1));
  TaskIdPool task_ids(width * depth);
  auto dag = make_layered_dag(task_ids, width, depth);

  for (auto _ : state) {
    auto levels = dag.levels();
    benchmark::DoNotOptimize(levels);
  }
  state.SetItemsProcessed(static_cast<int64_t>(width * depth) *
                          state.iterations());
}

// ===================================================================
// BM_DagDownstreamClosure
// Measures: reachability from the root of a layered grid.
// ===================================================================
void BM_DagDownstreamClosure(benchmark::State &state) {
  const auto width = static_cast<std::size_t>(state.range(0));
  const auto depth = static_cast<std::size_t>(state.range(1));
  TaskIdPool task_ids(width * depth);
  auto dag = make_layered_dag(task_ids, width, depth);

  for (auto _ : state) {
    auto closure = dag.downstream_closure(task_ids.at(0));
    benchmark::DoNotOptimize(closure);
  }
  state.SetItemsProcessed(static_cast<int64_t>(width * depth) *
                          state.iterations());
}

// ===================================================================
// BM_ParamResolve
// Measures: `${...}` expansion with a chained key and a date expression.
// ===================================================================
void BM_ParamResolve(benchmark::State &state) {
  ParameterStore store;
  store.set("day_id", std::string("${yyyy-MM-dd-1}"));
  store.set("path", std::string("/warehouse/events/dt=${day_id}"));
  store.set("limit", std::int64_t{1000});

  for (auto _ : state) {
    auto text = store.resolve("load ${path} limit ${limit} ${unknown}");
    benchmark::DoNotOptimize(text);
  }
  state.SetItemsProcessed(state.iterations());
}

// ===================================================================
// BM_EngineExecuteLayered
// Measures: full engine run of no-op callable tasks, sequential (0) or on a
// 4-thread pool (1).
// ===================================================================
void BM_EngineExecuteLayered(benchmark::State &state) {
  const auto parallel = state.range(0) != 0;
  const auto width = static_cast<std::size_t>(state.range(1));
  const auto depth = static_cast<std::size_t>(state.range(2));
  TaskIdPool task_ids(width * depth);
  auto dag = make_layered_dag(task_ids, width, depth, /*with_tasks=*/true);

  ExecutionEngine engine(EngineOptions{
      .workflow_name = "bench", .max_parallelism = parallel ? 4UZ : 1UZ});
  ParameterStore store;

  for (auto _ : state) {
    auto result = engine.execute(dag, store);
    if (!result) {
      state.SkipWithError("engine run failed");
      return;
    }
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(static_cast<int64_t>(width * depth) *
                          state.iterations());
}

BENCHMARK(BM_DagBuildLinear)
    ->RangeMultiplier(10)
    ->Range(1000, 100000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_DagLevelsLinear)
    ->RangeMultiplier(10)
    ->Range(1000, 100000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_DagLevelsLayered)
    ->Args({10, 100})
    ->Args({100, 10})
    ->Args({50, 50})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_DagDownstreamClosure)
    ->Args({10, 100})
    ->Args({100, 10})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_ParamResolve)->Unit(benchmark::kNanosecond);

BENCHMARK(BM_EngineExecuteLayered)
    ->Args({0, 16, 16})
    ->Args({1, 16, 16})
    ->Unit(benchmark::kMillisecond);

} // namespace
} // namespace dagweave

int main(int argc, char **argv) {
  dagweave::log::set_output_stderr();
  dagweave::log::set_level(dagweave::log::Level::Warn);

  benchmark::Initialize(&argc, argv);
  if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }
  benchmark::RunSpecifiedBenchmarks();
  benchmark::Shutdown();
  return 0;
}
