#include "dagweave/executor/callable_task.hpp"
#include "dagweave/executor/shell_task.hpp"
#include "dagweave/executor/sql_task.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "gtest/gtest.h"

using namespace dagweave;

namespace {

auto string_field(JsonValue &value, const char *key) -> std::string {
  const auto *s = value[key].get_if<std::string>();
  return s ? *s : std::string{};
}

} // namespace

TEST(TaskKindTest, NamesRoundTrip) {
  EXPECT_EQ(to_string_view(TaskKind::Shell), "shell");
  EXPECT_EQ(parse<TaskKind>("callable"), TaskKind::Callable);
  EXPECT_EQ(to_string_view(TaskState::Skipped), "skipped");
  EXPECT_EQ(to_string_view(TaskKind::Sql), "sql");
  EXPECT_EQ(parse<SqlEngine>("spark_sql"), SqlEngine::SparkSql);
  EXPECT_EQ(parse<SqlEngine>("HIVE"), SqlEngine::Hive);
  EXPECT_EQ(to_string_view(SqlEngine::SparkSql), "spark_sql");
  EXPECT_EQ(default_engine_binary(SqlEngine::SparkSql), "spark-sql");
}

TEST(TaskStateTest, TerminalStates) {
  EXPECT_FALSE(is_terminal(TaskState::Pending));
  EXPECT_FALSE(is_terminal(TaskState::Running));
  EXPECT_TRUE(is_terminal(TaskState::Success));
  EXPECT_TRUE(is_terminal(TaskState::Failed));
  EXPECT_TRUE(is_terminal(TaskState::Skipped));
}

TEST(ShellTaskConfigTest, DefaultConstruction_HasNoTimeout) {
  ShellTaskConfig config;

  EXPECT_TRUE(config.command.empty());
  EXPECT_TRUE(config.working_dir.empty());
  EXPECT_EQ(config.timeout, std::chrono::seconds(0));
}

class ShellTaskTest : public ::testing::Test {
protected:
  ParameterStore store_{test::fixed_clock(test::day(2024, 1, 10))};

  auto run(ShellTask &task) -> TaskResult {
    if (auto r = task.resolve_params(store_); !r) {
      return task_failed(r.error(), r.error().message());
    }
    return task.execute(UpstreamResults{});
  }
};

TEST_F(ShellTaskTest, CapturesStdout) {
  ShellTask task(TaskId("hello"), ShellTaskConfig{.command = "echo hello"});
  EXPECT_EQ(task.kind(), TaskKind::Shell);

  auto result = run(task);
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(string_field(*result, "stdout"), "hello\n");
  const auto *code = (*result)["exit_code"].get_if<std::int64_t>();
  ASSERT_NE(code, nullptr);
  EXPECT_EQ(*code, 0);
}

TEST_F(ShellTaskTest, CapturesStderrSeparately) {
  ShellTask task(TaskId("both"),
                 ShellTaskConfig{.command = "echo out; echo err >&2"});

  auto result = run(task);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(string_field(*result, "stdout"), "out\n");
  EXPECT_EQ(string_field(*result, "stderr"), "err\n");
}

TEST_F(ShellTaskTest, NonZeroExitFailsWithStderr) {
  ShellTask task(TaskId("broken"),
                 ShellTaskConfig{.command = "echo oops >&2; exit 3"});

  auto result = run(task);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::TaskExecutionFailed));
  EXPECT_NE(result.error().message.find("exited with code 3"),
            std::string::npos);
  EXPECT_NE(result.error().message.find("oops"), std::string::npos);
}

TEST_F(ShellTaskTest, TimeoutKillsLongCommand) {
  ShellTask task(TaskId("slow"),
                 ShellTaskConfig{.command = "sleep 10",
                                 .timeout = std::chrono::seconds(1)});

  const auto started = std::chrono::steady_clock::now();
  auto result = run(task);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::Timeout));
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ShellTaskTest, RunsInWorkingDirectory) {
  ShellTask task(TaskId("where"),
                 ShellTaskConfig{.command = "pwd", .working_dir = "/"});

  auto result = run(task);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(string_field(*result, "stdout"), "/\n");
}

TEST_F(ShellTaskTest, MissingWorkingDirectoryFails) {
  ShellTask task(TaskId("nowhere"),
                 ShellTaskConfig{.command = "true",
                                 .working_dir = "/nonexistent/dagweave"});

  auto result = run(task);
  EXPECT_FALSE(result.has_value());
}

TEST_F(ShellTaskTest, CommandUsesTaskParamsThenStore) {
  store_.set("who", std::string("world"));
  store_.set("greeting", std::string("hi"));
  ShellTask task(TaskId("greet"),
                 ShellTaskConfig{.command = "echo ${greeting} ${name} "
                                            "${yyyyMMdd-1}"},
                 ParamMap{{"name", std::string("${who}")},
                          {"greeting", std::string("hello")}});

  auto result = run(task);
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(task.resolved_command(), "echo hello world 20240109");
  EXPECT_EQ(string_field(*result, "stdout"), "hello world 20240109\n");
}

TEST_F(ShellTaskTest, CyclicCommandParameterFailsResolution) {
  store_.set("a", std::string("${a}"));
  ShellTask task(TaskId("loop"), ShellTaskConfig{.command = "echo ${a}"});

  auto r = task.resolve_params(store_);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::CyclicParameter));
}

TEST_F(ShellTaskTest, CloneKeepsDeclaredConfiguration) {
  ShellTask task(TaskId("copy"),
                 ShellTaskConfig{.command = "echo ${x}",
                                 .timeout = std::chrono::seconds(7)},
                 ParamMap{{"x", std::string("1")}});

  auto copy = task.clone();
  ASSERT_NE(copy, nullptr);
  auto *shell = dynamic_cast<ShellTask *>(copy.get());
  ASSERT_NE(shell, nullptr);
  EXPECT_EQ(shell->id(), TaskId("copy"));
  EXPECT_EQ(shell->config().timeout, std::chrono::seconds(7));
  EXPECT_EQ(std::get<std::string>(shell->declared_params().at("x")), "1");
}

// Stand-in for the hive / spark-sql client: prints each argument on its own
// line, the statement file's contents as SQL<...>, and that file's path on
// stderr.
constexpr const char *kEchoEngine = R"(#!/bin/sh
while [ $# -gt 0 ]; do
  if [ "$1" = "-f" ]; then
    printf 'SQL<%s>\n' "$(cat "$2")"
    echo "$2" >&2
    shift 2
    continue
  fi
  echo "$1"
  shift
done
)";

class SqlTaskTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() /
           std::format("dagweave_sql_{}", info->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);

    engine_ = dir_ / "echo-engine";
    write(engine_, kEchoEngine);
    std::filesystem::permissions(engine_, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add);
  }

  void TearDown() override {
    std::error_code ignored;
    std::filesystem::remove_all(dir_, ignored);
  }

  static auto write(const std::filesystem::path &path,
                    const std::string &content) -> void {
    std::ofstream out(path, std::ios::trunc);
    out << content;
  }

  auto run(SqlTask &task) -> TaskResult {
    if (auto r = task.resolve_params(store_); !r) {
      return task_failed(r.error(), r.error().message());
    }
    return task.execute(UpstreamResults{});
  }

  ParameterStore store_{test::fixed_clock(test::day(2024, 1, 10))};
  std::filesystem::path dir_;
  std::filesystem::path engine_;
};

TEST_F(SqlTaskTest, TemplatedSqlFileRunsThroughHiveClient) {
  write(dir_ / "daily.sql",
        "SELECT * FROM ${table} WHERE dt = '${yyyyMMdd-1}' "
        "AND region = '${hivevar:region}';\n");
  store_.set("queue", std::string("etl"));
  SqlTask task(TaskId("daily"),
               SqlTaskConfig{.engine = SqlEngine::Hive,
                             .engine_binary = engine_.string(),
                             .sql_file = "daily.sql",
                             .conf = {{"mapreduce.job.queuename", "${queue}"}},
                             .working_dir = dir_.string()},
               ParamMap{{"table", std::string("events")},
                        {"region", std::string("eu")}});
  EXPECT_EQ(task.kind(), TaskKind::Sql);

  auto result = run(task);
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(task.resolved_sql(),
            "SELECT * FROM events WHERE dt = '20240109' "
            "AND region = '${hivevar:region}';\n");
  EXPECT_EQ(string_field(*result, "stdout"),
            "--hiveconf\n"
            "mapreduce.job.queuename=etl\n"
            "SQL<SELECT * FROM events WHERE dt = '20240109' "
            "AND region = '${hivevar:region}';>\n"
            "--hivevar\n"
            "region=eu\n"
            "--hivevar\n"
            "table=events\n");
}

TEST_F(SqlTaskTest, StatementFileIsRemovedAfterRun) {
  SqlTask task(TaskId("tmp"),
               SqlTaskConfig{.engine_binary = engine_.string(),
                             .sql = "SELECT 1"});

  auto result = run(task);
  ASSERT_TRUE(result.has_value()) << result.error().message;
  auto statement_path = string_field(*result, "stderr");
  ASSERT_FALSE(statement_path.empty());
  statement_path.pop_back();
  EXPECT_FALSE(std::filesystem::exists(statement_path));
}

TEST_F(SqlTaskTest, SparkSqlLoadsInitScriptsWithSubstitution) {
  write(dir_ / "init.sql", "SET x = 1;\n");
  SqlTask task(TaskId("spark"),
               SqlTaskConfig{.engine = SqlEngine::SparkSql,
                             .engine_binary = engine_.string(),
                             .sql = "SELECT ${n}",
                             .init_files = {"init.sql"},
                             .working_dir = dir_.string()},
               ParamMap{{"n", std::int64_t{3}}});

  auto result = run(task);
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(string_field(*result, "stdout"),
            std::format("-i\n{}\n"
                        "--conf\nspark.sql.variable.substitution=true\n"
                        "SQL<SELECT 3>\n"
                        "--hivevar\nn=3\n",
                        (dir_ / "init.sql").string()));
}

TEST_F(SqlTaskTest, ExplicitSubstitutionSettingIsKept) {
  SqlTask task(TaskId("spark"),
               SqlTaskConfig{.engine = SqlEngine::SparkSql,
                             .sql = "SELECT 1",
                             .conf = {{"spark.sql.variable.substitution",
                                       "false"}},
                             .init_files = {"/etc/init.sql"}});
  ASSERT_TRUE(task.resolve_params(store_).has_value());

  EXPECT_EQ(task.engine_arguments("/tmp/q.sql"),
            (std::vector<std::string>{
                "-i", "/etc/init.sql", "--conf",
                "spark.sql.variable.substitution=false", "-f", "/tmp/q.sql"}));
}

TEST_F(SqlTaskTest, MissingInitScriptFailsBeforeLaunch) {
  SqlTask task(TaskId("noinit"),
               SqlTaskConfig{.engine_binary = engine_.string(),
                             .sql = "SELECT 1",
                             .init_files = {"absent.sql"},
                             .working_dir = dir_.string()});

  auto result = run(task);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::FileNotFound));
  EXPECT_NE(result.error().message.find("absent.sql"), std::string::npos);
}

TEST_F(SqlTaskTest, MissingSqlFileFailsResolution) {
  SqlTask task(TaskId("nofile"),
               SqlTaskConfig{.sql_file = "missing.sql",
                             .working_dir = dir_.string()});

  auto r = task.resolve_params(store_);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::FileNotFound));
}

TEST_F(SqlTaskTest, EngineExitCodeFailsTask) {
  SqlTask task(TaskId("broken"),
               SqlTaskConfig{.engine_binary = "false", .sql = "SELECT 1"});

  auto result = run(task);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::TaskExecutionFailed));
  EXPECT_NE(result.error().message.find("exited with code 1"),
            std::string::npos);
}

TEST_F(SqlTaskTest, UnknownEngineBinaryIsSpawnFailure) {
  SqlTask task(TaskId("noengine"),
               SqlTaskConfig{.engine_binary = "dagweave-no-such-engine",
                             .sql = "SELECT 1"});

  auto result = run(task);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::ProcessSpawnFailed));
}

TEST_F(SqlTaskTest, CloneKeepsDeclaredConfiguration) {
  SqlTask task(TaskId("copy"),
               SqlTaskConfig{.engine = SqlEngine::SparkSql,
                             .sql = "SELECT ${x}",
                             .timeout = std::chrono::seconds(9)},
               ParamMap{{"x", std::string("1")}});

  auto copy = task.clone();
  auto *sql = dynamic_cast<SqlTask *>(copy.get());
  ASSERT_NE(sql, nullptr);
  EXPECT_EQ(sql->config().engine, SqlEngine::SparkSql);
  EXPECT_EQ(sql->config().timeout, std::chrono::seconds(9));
  EXPECT_EQ(sql->resolved_sql(), "SELECT ${x}");
}

TEST(CallableTaskTest, SeesResolvedParamsAndUpstream) {
  ParameterStore store;
  store.set("day_id", std::string("2024-02-02"));

  CallableTask task(
      TaskId("report"),
      [](const TaskContext &ctx) -> TaskResult {
        const auto &day = std::get<std::string>(ctx.params.at("day"));
        return JsonValue{
            {"task", ctx.task_id.str()},
            {"day", day},
            {"inputs", static_cast<std::int64_t>(ctx.upstream.size())},
        };
      },
      ParamMap{{"day", std::string("${day_id}")}, {"limit", std::int64_t{5}}});
  EXPECT_EQ(task.kind(), TaskKind::Callable);

  ASSERT_TRUE(task.resolve_params(store).has_value());
  EXPECT_EQ(std::get<std::int64_t>(*task.get_param("limit")), 5);

  UpstreamResults upstream;
  upstream.emplace(TaskId("a"), JsonValue{{"ok", true}});
  upstream.emplace(TaskId("b"), JsonValue{{"ok", true}});

  auto result = task.execute(upstream);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(string_field(*result, "task"), "report");
  EXPECT_EQ(string_field(*result, "day"), "2024-02-02");
  const auto *inputs = (*result)["inputs"].get_if<std::int64_t>();
  ASSERT_NE(inputs, nullptr);
  EXPECT_EQ(*inputs, 2);
}

TEST(CallableTaskTest, ResolutionIsRepeatableWithNewStore) {
  CallableTask task(
      TaskId("echo"),
      [](const TaskContext &ctx) -> TaskResult {
        return JsonValue{
            {"day", std::get<std::string>(ctx.params.at("day"))}};
      },
      ParamMap{{"day", std::string("${day_id}")}});

  ParameterStore first;
  first.set("day_id", std::string("2024-01-01"));
  ASSERT_TRUE(task.resolve_params(first).has_value());
  EXPECT_EQ(std::get<std::string>(task.params().at("day")), "2024-01-01");

  ParameterStore second;
  second.set("day_id", std::string("2024-01-02"));
  ASSERT_TRUE(task.resolve_params(second).has_value());
  EXPECT_EQ(std::get<std::string>(task.params().at("day")), "2024-01-02");
  EXPECT_EQ(std::get<std::string>(task.declared_params().at("day")),
            "${day_id}");
}

TEST(CallableTaskTest, MissingFunctionFails) {
  CallableTask task(TaskId("empty"), TaskFn{});

  auto result = task.execute(UpstreamResults{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::InvalidArgument));
}

TEST(CallableTaskTest, FailureCarriesMessage) {
  CallableTask task(TaskId("fails"), [](const TaskContext &) -> TaskResult {
    return task_failed("upstream data missing");
  });

  auto result = task.execute(UpstreamResults{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message, "upstream data missing");
  EXPECT_EQ(result.error().code, make_error_code(Error::TaskExecutionFailed));
}
