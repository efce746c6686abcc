#include "dagweave/config/workflow_definition.hpp"
#include "dagweave/config/toml_util.hpp"

#include "dagweave/executor/shell_task.hpp"
#include "dagweave/executor/sql_task.hpp"
#include "dagweave/util/log.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <glaze/toml.hpp>

#include <format>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace dagweave {
namespace detail {

struct TaskDependencyToml {
  std::string task;
};

struct WorkflowTaskToml {
  std::string id;
  std::string type{"shell"};
  std::string command;
  std::string sql;
  std::string sql_file;
  std::string engine_binary;
  std::map<std::string, std::string> conf;
  std::vector<std::string> init_files;
  std::string working_dir;
  int timeout{0};
  std::vector<std::variant<std::string, TaskDependencyToml>> dependencies;
  toml_util::ParamTable params;
};

struct DependencyRuleToml {
  std::string from;
  std::string to;
};

struct WorkflowToml {
  std::string name;
  std::string description;
  bool fail_fast{true};
  toml_util::ParamTable params;
  std::vector<WorkflowTaskToml> tasks;
  std::vector<DependencyRuleToml> dependencies;
};

struct ParamsFileToml {
  toml_util::ParamTable params;
};

} // namespace detail
} // namespace dagweave

namespace glz {
template <> struct meta<dagweave::detail::TaskDependencyToml> {
  using T = dagweave::detail::TaskDependencyToml;
  static constexpr auto value = object("task", &T::task);
};

template <> struct meta<dagweave::detail::WorkflowTaskToml> {
  using T = dagweave::detail::WorkflowTaskToml;
  static constexpr auto value =
      object("id", &T::id, "type", &T::type, "command", &T::command, "sql",
             &T::sql, "sql_file", &T::sql_file, "engine_binary",
             &T::engine_binary, "conf", &T::conf, "init_files",
             &T::init_files, "working_dir", &T::working_dir, "timeout",
             &T::timeout, "dependencies", &T::dependencies, "params",
             &T::params);
};

template <> struct meta<dagweave::detail::DependencyRuleToml> {
  using T = dagweave::detail::DependencyRuleToml;
  static constexpr auto value = object("from", &T::from, "to", &T::to);
};

template <> struct meta<dagweave::detail::WorkflowToml> {
  using T = dagweave::detail::WorkflowToml;
  static constexpr auto value =
      object("name", &T::name, "description", &T::description, "fail_fast",
             &T::fail_fast, "params", &T::params, "tasks", &T::tasks,
             "dependencies", &T::dependencies);
};

template <> struct meta<dagweave::detail::ParamsFileToml> {
  using T = dagweave::detail::ParamsFileToml;
  static constexpr auto value = object("params", &T::params);
};
} // namespace glz

namespace dagweave {
namespace {

struct TaskType {
  TaskKind kind{TaskKind::Shell};
  SqlEngine engine{SqlEngine::Hive};
};

// "shell", "hive" or "spark_sql".
[[nodiscard]] auto parse_task_type(std::string_view type)
    -> std::optional<TaskType> {
  if (util::find_enum<TaskKind>(type) == TaskKind::Shell) {
    return TaskType{};
  }
  if (auto engine = util::find_enum<SqlEngine>(type)) {
    return TaskType{.kind = TaskKind::Sql, .engine = *engine};
  }
  return std::nullopt;
}

// "a, b,c" -> [a, b, c]; blanks are dropped.
[[nodiscard]] auto split_id_list(std::string_view text) -> std::vector<TaskId> {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, text, boost::algorithm::is_any_of(","));
  std::vector<TaskId> out;
  out.reserve(parts.size());
  for (auto &part : parts) {
    boost::algorithm::trim(part);
    if (!part.empty()) {
      out.emplace_back(std::move(part));
    }
  }
  return out;
}

[[nodiscard]] auto parse_dependencies(
    const std::vector<std::variant<std::string, detail::TaskDependencyToml>>
        &deps) -> std::vector<TaskId> {
  std::vector<TaskId> out;
  out.reserve(deps.size());
  for (const auto &dep : deps) {
    if (const auto *id = std::get_if<std::string>(&dep)) {
      if (!id->empty()) {
        out.emplace_back(*id);
      }
      continue;
    }
    const auto &d = std::get<detail::TaskDependencyToml>(dep);
    if (!d.task.empty()) {
      out.emplace_back(d.task);
    }
  }
  return out;
}

[[nodiscard]] auto parse_definition_from_text(std::string_view text,
                                              std::string *diagnostic)
    -> Result<WorkflowDefinition> {
  auto raw_result =
      toml_util::parse_toml<detail::WorkflowToml>(text, diagnostic);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  WorkflowDefinition def{};
  def.name = std::move(raw.name);
  def.description = std::move(raw.description);
  def.fail_fast = raw.fail_fast;
  def.params = toml_util::to_param_map(raw.params);

  def.tasks.reserve(raw.tasks.size());
  for (std::size_t i = 0; i < raw.tasks.size(); ++i) {
    const auto &task_raw = raw.tasks[i];
    if (task_raw.id.empty()) {
      auto err = std::format(
          "Workflow parse error: task #{} is missing required field 'id'",
          i + 1);
      log::error("{}", err);
      if (diagnostic) {
        *diagnostic = std::move(err);
      }
      return fail(Error::InvalidArgument);
    }
    const auto type = parse_task_type(task_raw.type);
    if (!type) {
      auto err = std::format("Task '{}': unsupported type '{}'", task_raw.id,
                             task_raw.type);
      log::error("{}", err);
      if (diagnostic) {
        *diagnostic = std::move(err);
      }
      return fail(Error::InvalidArgument);
    }

    const auto timeout = std::chrono::seconds(task_raw.timeout);
    auto &task = def.tasks.emplace_back(TaskDefinition{
        .id = TaskId(task_raw.id),
        .kind = type->kind,
        .command = task_raw.command,
        .working_dir = task_raw.working_dir,
        .timeout = timeout,
        .dependencies = parse_dependencies(task_raw.dependencies),
        .params = toml_util::to_param_map(task_raw.params)});
    if (type->kind == TaskKind::Sql) {
      task.sql = SqlTaskConfig{.engine = type->engine,
                               .engine_binary = task_raw.engine_binary,
                               .sql = task_raw.sql,
                               .sql_file = task_raw.sql_file,
                               .conf = task_raw.conf,
                               .init_files = task_raw.init_files,
                               .working_dir = task_raw.working_dir,
                               .timeout = timeout};
    }
  }

  def.dependencies.reserve(raw.dependencies.size());
  for (const auto &rule : raw.dependencies) {
    def.dependencies.emplace_back(DependencyRule{
        .from = split_id_list(rule.from), .to = split_id_list(rule.to)});
  }
  return ok(std::move(def));
}

} // namespace

auto WorkflowDefinition::edges() const
    -> std::vector<std::pair<TaskId, TaskId>> {
  std::vector<std::pair<TaskId, TaskId>> out;
  for (const auto &task : tasks) {
    for (const auto &dep : task.dependencies) {
      out.emplace_back(dep, task.id);
    }
  }
  for (const auto &rule : dependencies) {
    for (const auto &from : rule.from) {
      for (const auto &to : rule.to) {
        out.emplace_back(from, to);
      }
    }
  }
  return out;
}

auto WorkflowDefinition::build_graph() const -> Result<DAG> {
  DAG graph;
  for (const auto &task : tasks) {
    std::unique_ptr<ITask> runnable;
    switch (task.kind) {
    case TaskKind::Shell:
      runnable = std::make_unique<ShellTask>(
          task.id,
          ShellTaskConfig{.command = task.command,
                          .working_dir = task.working_dir,
                          .timeout = task.timeout},
          task.params);
      break;
    case TaskKind::Sql:
      runnable = std::make_unique<SqlTask>(task.id, task.sql, task.params);
      break;
    case TaskKind::Callable:
      log::error("Task '{}': kind '{}' cannot be built from a workflow file",
                 task.id, to_string_view(task.kind));
      return fail(Error::InvalidArgument);
    }
    if (auto r = graph.add_task(std::move(runnable)); !r) {
      return fail(r.error());
    }
  }
  for (const auto &[from, to] : edges()) {
    if (auto r = graph.add_edge(from, to); !r) {
      log::error("Workflow '{}': dependency {} -> {} names an unknown task",
                 name, from, to);
      return fail(r.error());
    }
  }
  return ok(std::move(graph));
}

auto WorkflowDefinition::make_graph_factory() const -> GraphFactory {
  return [def = std::make_shared<const WorkflowDefinition>(*this)] {
    return def->build_graph();
  };
}

auto validate_definition(const WorkflowDefinition &def)
    -> std::vector<std::string> {
  std::vector<std::string> errors;

  if (def.name.empty()) {
    errors.emplace_back("Workflow name cannot be empty");
  }
  if (def.tasks.empty()) {
    errors.emplace_back("Workflow must have at least one task");
    return errors;
  }

  TaskIdSet task_ids;
  for (const auto &task : def.tasks) {
    if (!is_valid_id(task.id.value())) {
      errors.emplace_back(
          std::format("Task ID '{}' is empty or contains control characters",
                      task.id));
      continue;
    }
    if (!task_ids.insert(task.id).second) {
      errors.emplace_back(std::format("Duplicate task ID: '{}'", task.id));
    }
    if (task.kind == TaskKind::Shell && task.command.empty()) {
      errors.emplace_back(
          std::format("Task '{}': command cannot be empty", task.id));
    }
    if (task.kind == TaskKind::Sql &&
        task.sql.sql.empty() == task.sql.sql_file.empty()) {
      errors.emplace_back(std::format(
          "Task '{}': set exactly one of sql and sql_file", task.id));
    }
    if (task.timeout.count() < 0) {
      errors.emplace_back(
          std::format("Task '{}': negative timeout not allowed", task.id));
    }
  }

  const auto edges = def.edges();
  for (const auto &[from, to] : edges) {
    for (const auto *id : {&from, &to}) {
      if (!task_ids.contains(*id)) {
        errors.emplace_back(std::format(
            "Dependency {} -> {}: task '{}' not found", from, to, *id));
      }
    }
  }

  if (errors.empty()) {
    DAG shape;
    for (const auto &task : def.tasks) {
      (void)shape.add_node(task.id);
    }
    for (const auto &[from, to] : edges) {
      (void)shape.add_edge(from, to);
    }
    if (auto res = shape.is_valid(); !res) {
      errors.emplace_back("Circular dependency detected");
    }
  }

  return errors;
}

auto WorkflowLoader::load_from_file(std::string_view path,
                                    std::string *diagnostic)
    -> Result<WorkflowDefinition> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = text.error().message();
    }
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto WorkflowLoader::load_from_string(std::string_view toml_str,
                                      std::string *diagnostic)
    -> Result<WorkflowDefinition> {
  try {
    auto result = parse_definition_from_text(toml_str, diagnostic);
    if (!result) {
      return fail(result.error());
    }

    auto errors = validate_definition(*result);
    if (!errors.empty()) {
      if (diagnostic) {
        *diagnostic = boost::algorithm::join(errors, "; ");
      }
      for (const auto &err : errors) {
        log::error("Workflow validation error: {}", err);
      }
      return fail(Error::InvalidArgument);
    }
    return result;
  } catch (const std::exception &e) {
    log::error("TOML parse error: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

auto load_params_file(std::string_view path) -> Result<ParamMap> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  auto raw = toml_util::parse_toml<detail::ParamsFileToml>(*text);
  if (!raw) {
    return fail(raw.error());
  }
  return ok(toml_util::to_param_map(raw->params));
}

} // namespace dagweave
