#pragma once

#include "dagweave/core/error.hpp"
#include "dagweave/dag/dag.hpp"
#include "dagweave/executor/sql_task.hpp"
#include "dagweave/params/parameter_store.hpp"
#include "dagweave/scheduler/task.hpp"
#include "dagweave/util/id.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dagweave {

struct TaskDefinition {
  TaskId id;
  TaskKind kind{TaskKind::Shell};
  std::string command;
  std::string working_dir;
  std::chrono::seconds timeout{0};
  std::vector<TaskId> dependencies;
  ParamMap params;
  // Statement and engine settings; only read for TaskKind::Sql.
  SqlTaskConfig sql;
};

// Every id in `from` becomes upstream of every id in `to`.
struct DependencyRule {
  std::vector<TaskId> from;
  std::vector<TaskId> to;
};

/// Parsed workflow file. Immutable once loaded; graphs are built from it on
/// demand so that each run or backfill date point gets its own task objects.
struct WorkflowDefinition {
  std::string name;
  std::string description;
  bool fail_fast{true};
  ParamMap params;
  std::vector<TaskDefinition> tasks;
  std::vector<DependencyRule> dependencies;

  /// All edges, task-level `dependencies` first, then the rules in order.
  [[nodiscard]] auto edges() const -> std::vector<std::pair<TaskId, TaskId>>;

  [[nodiscard]] auto build_graph() const -> Result<DAG>;

  /// The factory owns a copy of the definition.
  [[nodiscard]] auto make_graph_factory() const -> GraphFactory;
};

/// Human-readable problems; empty when the definition is usable.
[[nodiscard]] auto validate_definition(const WorkflowDefinition &def)
    -> std::vector<std::string>;

class WorkflowLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<WorkflowDefinition>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<WorkflowDefinition>;
};

/// `[params]` table of a standalone parameter file (`run --params`).
[[nodiscard]] auto load_params_file(std::string_view path) -> Result<ParamMap>;

} // namespace dagweave
