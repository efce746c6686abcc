#include "dagweave/config/backfill_config.hpp"
#include "dagweave/config/config.hpp"
#include "dagweave/config/workflow_definition.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <vector>

using namespace dagweave;

namespace {

class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  const char *name_;
};

auto write_temp(const std::string &name, const std::string &content)
    -> std::filesystem::path {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return path;
}

auto edge_strings(const WorkflowDefinition &def) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto &[from, to] : def.edges()) {
    out.emplace_back(std::format("{}->{}", from, to));
  }
  return out;
}

auto has_error_containing(const std::vector<std::string> &errors,
                          std::string_view needle) -> bool {
  return std::ranges::any_of(errors, [&](const std::string &e) {
    return e.find(needle) != std::string::npos;
  });
}

constexpr const char *kEtlWorkflow = R"(
name = "etl"
description = "daily pipeline"

[params]
region = "eu"
batch = 500
ratio = 0.5
verbose = true

[[tasks]]
id = "extract"
command = "echo extract ${region}"
timeout = 30

[[tasks]]
id = "transform"
command = "echo transform"
dependencies = ["extract"]
params = { mode = "full" }

[[tasks]]
id = "load"
command = "echo load"
working_dir = "/tmp"
dependencies = [{ task = "transform" }]
)";

} // namespace

TEST(ConfigTest, SchedulerDefaults) {
  SchedulerConfig cfg;
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_TRUE(cfg.log_file.empty());
  EXPECT_EQ(cfg.max_parallelism, 1);
}

TEST(ConfigTest, LoadFromTomlString) {
  auto result = ConfigLoader::load_from_string(R"(
[scheduler]
log_level = "debug"
log_file = "/tmp/dagweave.log"
max_parallelism = 8
)");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->scheduler.log_level, "debug");
  EXPECT_EQ(result->scheduler.log_file, "/tmp/dagweave.log");
  EXPECT_EQ(result->scheduler.max_parallelism, 8);
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
  auto result =
      ConfigLoader::load_from_string("[scheduler]\nlog_level = \"info\"\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, SystemConfig{});
}

TEST(ConfigTest, EnvironmentOverridesFileValues) {
  ScopedEnv level("DAGWEAVE_LOG_LEVEL", "error");
  ScopedEnv parallelism("DAGWEAVE_MAX_PARALLELISM", "3");

  auto result = ConfigLoader::load_from_string(R"(
[scheduler]
log_level = "debug"
max_parallelism = 8
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->scheduler.log_level, "error");
  EXPECT_EQ(result->scheduler.max_parallelism, 3);
}

TEST(ConfigTest, NonNumericEnvironmentOverrideIsRejected) {
  ScopedEnv parallelism("DAGWEAVE_MAX_PARALLELISM", "many");
  auto result =
      ConfigLoader::load_from_string("[scheduler]\nlog_level = \"info\"\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, InvalidValuesAreRejected) {
  auto zero = ConfigLoader::load_from_string(
      "[scheduler]\nmax_parallelism = 0\n");
  ASSERT_FALSE(zero.has_value());
  EXPECT_EQ(zero.error(), make_error_code(Error::ParseError));

  auto level = ConfigLoader::load_from_string(
      "[scheduler]\nlog_level = \"loud\"\n");
  ASSERT_FALSE(level.has_value());
  EXPECT_EQ(level.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, MissingFileIsReported) {
  auto result = ConfigLoader::load_from_file("/nonexistent/dagweave.toml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(WorkflowConfigTest, LoadsTasksParamsAndDependencies) {
  std::string diagnostic;
  auto def = WorkflowLoader::load_from_string(kEtlWorkflow, &diagnostic);
  ASSERT_TRUE(def.has_value()) << diagnostic;

  EXPECT_EQ(def->name, "etl");
  EXPECT_EQ(def->description, "daily pipeline");
  EXPECT_TRUE(def->fail_fast);
  ASSERT_EQ(def->tasks.size(), 3);

  EXPECT_EQ(std::get<std::string>(def->params.at("region")), "eu");
  EXPECT_EQ(std::get<std::int64_t>(def->params.at("batch")), 500);
  EXPECT_DOUBLE_EQ(std::get<double>(def->params.at("ratio")), 0.5);
  EXPECT_TRUE(std::get<bool>(def->params.at("verbose")));

  const auto &extract = def->tasks[0];
  EXPECT_EQ(extract.id, TaskId("extract"));
  EXPECT_EQ(extract.kind, TaskKind::Shell);
  EXPECT_EQ(extract.timeout, std::chrono::seconds(30));

  const auto &transform = def->tasks[1];
  EXPECT_EQ(std::get<std::string>(transform.params.at("mode")), "full");

  EXPECT_EQ(def->tasks[2].working_dir, "/tmp");
  EXPECT_EQ(edge_strings(*def), (std::vector<std::string>{
                                    "extract->transform", "transform->load"}));
}

TEST(WorkflowConfigTest, DependencyRulesExpandToEveryPair) {
  auto def = WorkflowLoader::load_from_string(R"(
name = "fan"

[[tasks]]
id = "a"
command = "true"

[[tasks]]
id = "b"
command = "true"

[[tasks]]
id = "c"
command = "true"

[[tasks]]
id = "d"
command = "true"

[[dependencies]]
from = "a, b"
to = "c,d"
)");
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(edge_strings(*def),
            (std::vector<std::string>{"a->c", "a->d", "b->c", "b->d"}));

  auto graph = def->build_graph();
  ASSERT_TRUE(graph.has_value());
  auto levels = graph->levels();
  ASSERT_TRUE(levels.has_value());
  ASSERT_EQ(levels->size(), 2);
  EXPECT_EQ(test::ids((*levels)[0]), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(test::ids((*levels)[1]), (std::vector<std::string>{"c", "d"}));
}

TEST(WorkflowConfigTest, UnsupportedTaskTypeIsRejected) {
  std::string diagnostic;
  auto def = WorkflowLoader::load_from_string(R"(
name = "bad"

[[tasks]]
id = "a"
type = "docker"
command = "true"
)",
                                              &diagnostic);
  ASSERT_FALSE(def.has_value());
  EXPECT_EQ(def.error(), make_error_code(Error::InvalidArgument));
  EXPECT_NE(diagnostic.find("docker"), std::string::npos);
}

TEST(WorkflowConfigTest, LoadsHiveAndSparkSqlTasks) {
  std::string diagnostic;
  auto def = WorkflowLoader::load_from_string(R"(
name = "warehouse"

[[tasks]]
id = "stage"
type = "hive"
sql_file = "sql/stage.sql"
working_dir = "/opt/etl"
init_files = ["udfs.sql", "settings.sql"]
conf = { queue = "etl" }
timeout = 600
params = { table = "events" }

[[tasks]]
id = "report"
type = "spark_sql"
sql = "SELECT count(*) FROM ${table}"
engine_binary = "/usr/local/bin/spark-sql"
dependencies = ["stage"]
)",
                                              &diagnostic);
  ASSERT_TRUE(def.has_value()) << diagnostic;
  ASSERT_EQ(def->tasks.size(), 2);

  const auto &stage = def->tasks[0];
  EXPECT_EQ(stage.kind, TaskKind::Sql);
  EXPECT_EQ(stage.sql.engine, SqlEngine::Hive);
  EXPECT_EQ(stage.sql.sql_file, "sql/stage.sql");
  EXPECT_EQ(stage.sql.working_dir, "/opt/etl");
  EXPECT_EQ(stage.sql.init_files,
            (std::vector<std::string>{"udfs.sql", "settings.sql"}));
  EXPECT_EQ(stage.sql.conf.at("queue"), "etl");
  EXPECT_EQ(stage.sql.timeout, std::chrono::seconds(600));

  const auto &report = def->tasks[1];
  EXPECT_EQ(report.kind, TaskKind::Sql);
  EXPECT_EQ(report.sql.engine, SqlEngine::SparkSql);
  EXPECT_EQ(report.sql.sql, "SELECT count(*) FROM ${table}");
  EXPECT_EQ(report.sql.engine_binary, "/usr/local/bin/spark-sql");

  auto graph = def->build_graph();
  ASSERT_TRUE(graph.has_value());
  ASSERT_NE(graph->task(TaskId("report")), nullptr);
  EXPECT_EQ(graph->task(TaskId("report"))->kind(), TaskKind::Sql);
  EXPECT_TRUE(graph->has_edge(TaskId("stage"), TaskId("report")));
}

TEST(WorkflowConfigTest, SqlTaskNeedsExactlyOneStatementSource) {
  std::string diagnostic;
  auto def = WorkflowLoader::load_from_string(R"(
name = "bad"

[[tasks]]
id = "neither"
type = "hive"

[[tasks]]
id = "both"
type = "spark_sql"
sql = "SELECT 1"
sql_file = "q.sql"
)",
                                              &diagnostic);
  ASSERT_FALSE(def.has_value());
  EXPECT_NE(diagnostic.find("'neither': set exactly one of sql and sql_file"),
            std::string::npos);
  EXPECT_NE(diagnostic.find("'both': set exactly one of sql and sql_file"),
            std::string::npos);
}

TEST(WorkflowConfigTest, MalformedTomlIsAParseError) {
  auto def = WorkflowLoader::load_from_string("name = \"x\"\n[[tasks\n");
  ASSERT_FALSE(def.has_value());
  EXPECT_EQ(def.error(), make_error_code(Error::ParseError));
}

TEST(WorkflowConfigTest, ValidationCollectsEveryProblem) {
  WorkflowDefinition def;
  def.tasks = {
      TaskDefinition{.id = TaskId("a"), .command = "true"},
      TaskDefinition{.id = TaskId("a"), .command = "true"},
      TaskDefinition{.id = TaskId("b"),
                     .command = "",
                     .dependencies = {TaskId("ghost")}},
  };

  auto errors = validate_definition(def);
  EXPECT_TRUE(has_error_containing(errors, "name cannot be empty"));
  EXPECT_TRUE(has_error_containing(errors, "Duplicate task ID: 'a'"));
  EXPECT_TRUE(has_error_containing(errors, "command cannot be empty"));
  EXPECT_TRUE(has_error_containing(errors, "'ghost' not found"));
}

TEST(WorkflowConfigTest, ValidationDetectsCycles) {
  WorkflowDefinition def;
  def.name = "loop";
  def.tasks = {
      TaskDefinition{.id = TaskId("a"),
                     .command = "true",
                     .dependencies = {TaskId("c")}},
      TaskDefinition{.id = TaskId("b"),
                     .command = "true",
                     .dependencies = {TaskId("a")}},
      TaskDefinition{.id = TaskId("c"),
                     .command = "true",
                     .dependencies = {TaskId("b")}},
  };
  auto errors = validate_definition(def);
  ASSERT_EQ(errors.size(), 1);
  EXPECT_EQ(errors[0], "Circular dependency detected");

  def.tasks[0].dependencies.clear();
  EXPECT_TRUE(validate_definition(def).empty());
}

TEST(WorkflowConfigTest, EmptyWorkflowIsInvalid) {
  std::string diagnostic;
  auto def = WorkflowLoader::load_from_string("name = \"empty\"\n",
                                              &diagnostic);
  ASSERT_FALSE(def.has_value());
  EXPECT_NE(diagnostic.find("at least one task"), std::string::npos);
}

TEST(WorkflowConfigTest, GraphFactoryBuildsFreshGraphs) {
  auto def = WorkflowLoader::load_from_string(kEtlWorkflow);
  ASSERT_TRUE(def.has_value());
  auto factory = def->make_graph_factory();

  auto first = factory();
  auto second = factory();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->size(), 3);
  EXPECT_TRUE(second->has_edge(TaskId("extract"), TaskId("transform")));
  ASSERT_NE(first->task(TaskId("load")), nullptr);
  EXPECT_NE(first->task(TaskId("load")), second->task(TaskId("load")));
  EXPECT_EQ(first->task(TaskId("load"))->kind(), TaskKind::Shell);
}

TEST(WorkflowConfigTest, LoadsFromFile) {
  auto path = write_temp("dagweave_config_test_workflow.toml", kEtlWorkflow);
  auto def = WorkflowLoader::load_from_file(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->tasks.size(), 3);

  auto missing = WorkflowLoader::load_from_file("/nonexistent/wf.toml");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::FileNotFound));
}

TEST(WorkflowConfigTest, ParamsFileReadsParamsTable) {
  auto path = write_temp("dagweave_config_test_params.toml",
                         "[params]\nregion = \"us\"\nlimit = 10\n");
  auto params = load_params_file(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(params.has_value());
  EXPECT_EQ(std::get<std::string>(params->at("region")), "us");
  EXPECT_EQ(std::get<std::int64_t>(params->at("limit")), 10);
}

TEST(BackfillConfigTest, LoadsRangeAndFormats) {
  std::string diagnostic;
  auto request = BackfillConfigLoader::load_from_string(R"(
start_date = "2024-01-01"
end_date = "2024-03-31"
date_granularity = "month"
date_param_names = ["day_id", "ds"]
fail_fast = false

[date_param_formats]
ds = "%Y%m%d"

[params]
env = "prod"
)",
                                                        &diagnostic);
  ASSERT_TRUE(request.has_value()) << diagnostic;
  EXPECT_EQ(request->date_spec.start_date, "2024-01-01");
  EXPECT_EQ(request->date_spec.end_date, "2024-03-31");
  EXPECT_EQ(request->date_spec.granularity, Granularity::Month);
  EXPECT_EQ(request->date_param_names,
            (std::vector<std::string>{"day_id", "ds"}));
  EXPECT_EQ(request->date_param_formats.at("ds"), "%Y%m%d");
  EXPECT_FALSE(request->fail_fast);
  EXPECT_FALSE(request->dry_run);
  EXPECT_EQ(std::get<std::string>(request->custom_params.at("env")), "prod");

  auto plan = BackfillPlanner::plan(request->date_spec);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->size(), 3);
}

TEST(BackfillConfigTest, CustomDatesAndSingleParamName) {
  auto request = BackfillConfigLoader::load_from_string(R"(
custom_dates = ["2024-02-01", "2024-02-03"]
date_param_name = "biz_date"
dry_run = true
)");
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->date_spec.dates,
            (std::vector<std::string>{"2024-02-01", "2024-02-03"}));
  EXPECT_EQ(request->date_param_names,
            std::vector<std::string>{"biz_date"});
  EXPECT_EQ(request->date_spec.granularity, Granularity::Day);
  EXPECT_TRUE(request->dry_run);
}

TEST(BackfillConfigTest, MissingDatesAreRejected) {
  auto request =
      BackfillConfigLoader::load_from_string("start_date = \"2024-01-01\"\n");
  ASSERT_FALSE(request.has_value());
  EXPECT_EQ(request.error(), make_error_code(Error::InvalidDateRange));
}

TEST(BackfillConfigTest, UnknownGranularityIsRejected) {
  std::string diagnostic;
  auto request = BackfillConfigLoader::load_from_string(R"(
start_date = "2024-01-01"
end_date = "2024-01-31"
date_granularity = "fortnight"
)",
                                                        &diagnostic);
  ASSERT_FALSE(request.has_value());
  EXPECT_EQ(request.error(), make_error_code(Error::InvalidArgument));
  EXPECT_NE(diagnostic.find("fortnight"), std::string::npos);
}

TEST(BackfillConfigTest, RerunSnippetLoadsBack) {
  BackfillRequest original;
  original.date_param_formats.emplace("day_id", "%Y%m%d");
  BackfillReport report;
  report.failed_dates = {test::day(2024, 1, 2), test::day(2024, 1, 5)};

  auto request =
      BackfillConfigLoader::load_from_string(render_rerun_config(report,
                                                                 original));
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->date_spec.dates,
            (std::vector<std::string>{"2024-01-02", "2024-01-05"}));
  EXPECT_EQ(request->date_param_formats.at("day_id"), "%Y%m%d");
}
