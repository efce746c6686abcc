#include "dagweave/cli/commands.hpp"
#include "dagweave/cli/formatting.hpp"
#include "dagweave/config/workflow_definition.hpp"
#include "dagweave/util/json.hpp"

#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <cstdint>
#include <print>
#include <string>
#include <vector>

namespace dagweave::cli {

namespace {

// SQL tasks are listed by engine: "hive" or "spark_sql".
auto type_name(const TaskDefinition &task) -> std::string {
  if (task.kind == TaskKind::Sql) {
    return std::string(to_string_view(task.sql.engine));
  }
  return std::string(to_string_view(task.kind));
}

auto id_strings(const std::vector<TaskId> &ids) -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(ids.size());
  for (const auto &id : ids) {
    out.emplace_back(id.str());
  }
  return out;
}

auto params_json(const ParamMap &params) -> JsonValue {
  JsonValue obj = JsonValue::object_t{};
  for (const auto &[key, value] : params) {
    obj.get_object().emplace(key, param_to_string(value));
  }
  return obj;
}

auto print_json(const WorkflowDefinition &def, const DAG &graph,
                const Levels &levels) -> void {
  JsonValue tasks = std::vector<JsonValue>{};
  for (const auto &task : def.tasks) {
    JsonValue upstream = std::vector<JsonValue>{};
    for (const auto &dep : graph.direct_upstream_of(task.id)) {
      upstream.get_array().emplace_back(dep.str());
    }
    JsonValue entry{
        {"id", task.id.str()},
        {"type", type_name(task)},
        {"timeout", static_cast<std::int64_t>(task.timeout.count())},
        {"upstream", std::move(upstream)},
        {"params", params_json(task.params)},
    };
    if (task.kind == TaskKind::Sql) {
      entry["sql"] = task.sql.sql;
      entry["sql_file"] = task.sql.sql_file;
    } else {
      entry["command"] = task.command;
    }
    tasks.get_array().emplace_back(std::move(entry));
  }

  JsonValue level_arr = std::vector<JsonValue>{};
  for (const auto &level : levels) {
    JsonValue ids = std::vector<JsonValue>{};
    for (const auto &id : level) {
      ids.get_array().emplace_back(id.str());
    }
    level_arr.get_array().emplace_back(std::move(ids));
  }

  JsonValue output{
      {"name", def.name},
      {"description", def.description},
      {"fail_fast", def.fail_fast},
      {"params", params_json(def.params)},
      {"tasks", std::move(tasks)},
      {"levels", std::move(level_arr)},
  };
  std::println("{}", dump_json(output));
}

auto print_text(const WorkflowDefinition &def, const DAG &graph,
                const Levels &levels) -> void {
  std::println("{} {}", fmt::ansi::bold("Workflow:"), def.name);
  if (!def.description.empty()) {
    std::println("{}", fmt::ansi::dim(def.description));
  }
  std::println("Fail fast: {}", def.fail_fast ? "yes" : "no");

  if (!def.params.empty()) {
    std::println("\nParameters:");
    std::vector<std::string> keys;
    for (const auto &[key, value] : def.params) {
      keys.emplace_back(key);
    }
    std::ranges::sort(keys);
    for (const auto &key : keys) {
      std::println("  {} = {}", key, param_to_string(def.params.at(key)));
    }
  }

  std::println("");
  fmt::Table table({"TASK", "TYPE", "UPSTREAM"});
  for (const auto &task : def.tasks) {
    auto upstream = id_strings(graph.direct_upstream_of(task.id));
    table.add_row({task.id.str(), type_name(task),
                   upstream.empty() ? std::string("-")
                                    : boost::algorithm::join(upstream, ", ")});
  }
  table.print();

  std::println("\nExecution levels:");
  for (std::size_t i = 0; i < levels.size(); ++i) {
    std::println("  {}: {}", i + 1,
                 boost::algorithm::join(id_strings(levels[i]), ", "));
  }
}

} // namespace

auto cmd_info(const InfoOptions &opts) -> int {
  if (!setup_logging(opts.global, /*apply_file_level=*/false)) {
    return 1;
  }

  std::string diagnostic;
  auto def = WorkflowLoader::load_from_file(opts.workflow_file, &diagnostic);
  if (!def) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? def.error().message() : diagnostic);
    return 1;
  }
  auto graph = def->build_graph();
  if (!graph) {
    std::println(stderr, "Error: {}", graph.error().message());
    return 1;
  }
  auto levels = graph->levels();
  if (!levels) {
    std::println(stderr, "Error: {}", levels.error().message());
    return 1;
  }

  if (opts.json) {
    print_json(*def, *graph, *levels);
  } else {
    print_text(*def, *graph, *levels);
  }
  return 0;
}

} // namespace dagweave::cli
