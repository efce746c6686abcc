#include "dagweave/executor/sql_task.hpp"

#include "dagweave/executor/process_runner.hpp"
#include "dagweave/util/log.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/system/system_error.hpp>

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace dagweave {

namespace {

namespace fs = std::filesystem;

inline constexpr std::string_view kSparkSubstitution =
    "spark.sql.variable.substitution";

// Resolved statement text on disk for the lifetime of one execution.
class StatementFile {
public:
  explicit StatementFile(fs::path path) : path_(std::move(path)) {}
  ~StatementFile() {
    std::error_code ignored;
    fs::remove(path_, ignored);
  }

  StatementFile(const StatementFile &) = delete;
  StatementFile &operator=(const StatementFile &) = delete;

  [[nodiscard]] auto write(const std::string &text) const -> bool {
    std::ofstream out(path_, std::ios::out | std::ios::binary |
                                 std::ios::trunc);
    out << text;
    return static_cast<bool>(out);
  }

  [[nodiscard]] auto path() const -> const fs::path & { return path_; }

private:
  fs::path path_;
};

} // namespace

auto default_engine_binary(SqlEngine engine) -> std::string_view {
  switch (engine) {
  case SqlEngine::Hive:
    return "hive";
  case SqlEngine::SparkSql:
    return "spark-sql";
  }
  return "hive";
}

SqlTask::SqlTask(TaskId id, SqlTaskConfig config, ParamMap params)
    : TaskBase(std::move(id), std::move(params)), config_(std::move(config)),
      resolved_sql_(config_.sql), resolved_conf_(config_.conf) {}

auto SqlTask::in_working_dir(const std::string &path) const -> std::string {
  if (config_.working_dir.empty() || fs::path(path).is_absolute()) {
    return path;
  }
  return (fs::path(config_.working_dir) / path).string();
}

auto SqlTask::load_statement() const -> Result<std::string> {
  if (!config_.sql.empty()) {
    return ok(config_.sql);
  }
  if (config_.sql_file.empty()) {
    log::error("SqlTask '{}': neither sql nor sql_file is set", id_);
    return fail(Error::InvalidArgument);
  }

  const auto path = in_working_dir(config_.sql_file);
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    log::error("SqlTask '{}': cannot open sql_file '{}'", id_, path);
    return fail(Error::FileNotFound);
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return ok(std::move(contents).str());
}

auto SqlTask::resolve_params(const ParameterStore &store) -> Result<void> {
  if (auto r = TaskBase::resolve_params(store); !r) {
    return r;
  }

  auto statement = load_statement();
  if (!statement) {
    return fail(statement.error());
  }

  ParameterStore scoped = store;
  scoped.set(resolved_);
  auto sql = scoped.resolve(*statement);
  if (!sql) {
    return fail(sql.error());
  }

  std::map<std::string, std::string> conf;
  for (const auto &[key, value] : config_.conf) {
    auto resolved = scoped.resolve(value);
    if (!resolved) {
      log::error("SqlTask '{}': failed to resolve conf '{}'", id_, key);
      return fail(resolved.error());
    }
    conf.emplace(key, std::move(*resolved));
  }

  resolved_sql_ = std::move(*sql);
  resolved_conf_ = std::move(conf);
  return ok();
}

auto SqlTask::engine_arguments(const std::string &statement_file) const
    -> std::vector<std::string> {
  std::vector<std::string> args;
  for (const auto &init : config_.init_files) {
    args.emplace_back("-i");
    args.emplace_back(in_working_dir(init));
  }

  auto conf = resolved_conf_;
  if (config_.engine == SqlEngine::SparkSql && !config_.init_files.empty()) {
    conf.try_emplace(std::string(kSparkSubstitution), "true");
  }
  const char *conf_flag =
      config_.engine == SqlEngine::Hive ? "--hiveconf" : "--conf";
  for (const auto &[key, value] : conf) {
    args.emplace_back(conf_flag);
    args.emplace_back(std::format("{}={}", key, value));
  }

  args.emplace_back("-f");
  args.emplace_back(statement_file);

  // Sorted so the command line is stable between runs.
  const std::map<std::string, std::string> vars = [this] {
    std::map<std::string, std::string> out;
    for (const auto &[name, value] : resolved_) {
      out.emplace(name, param_to_string(value));
    }
    return out;
  }();
  for (const auto &[name, value] : vars) {
    args.emplace_back("--hivevar");
    args.emplace_back(std::format("{}={}", name, value));
  }
  return args;
}

auto SqlTask::execute(const UpstreamResults & /*upstream*/) -> TaskResult {
  for (const auto &init : config_.init_files) {
    const auto path = in_working_dir(init);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      log::error("SqlTask '{}': init script '{}' not found", id_, path);
      return task_failed(make_error_code(Error::FileNotFound),
                         std::format("init script not found: {}", path));
    }
  }

  std::error_code ec;
  const auto tmp_dir = fs::temp_directory_path(ec);
  if (ec) {
    return task_failed(std::format("no temporary directory: {}", ec.message()));
  }
  const StatementFile statement(
      tmp_dir / std::format("dagweave-sql-{}.sql", generate_run_id()));
  if (!statement.write(resolved_sql_)) {
    return task_failed(std::format("cannot write statement file '{}'",
                                   statement.path().string()));
  }

  const auto binary = config_.engine_binary.empty()
                          ? std::string(default_engine_binary(config_.engine))
                          : config_.engine_binary;
  const auto args = engine_arguments(statement.path().string());
  log::info("SqlTask '{}': engine={} timeout={}s sql='{}'", id_,
            to_string_view(config_.engine), config_.timeout.count(),
            command_preview(boost::algorithm::trim_copy(resolved_sql_)));
  log::debug("SqlTask '{}': {} {}", id_, binary,
             boost::algorithm::join(args, " "));

  ProcessOutcome outcome;
  try {
    outcome = run_process(binary, args, config_.working_dir, config_.timeout);
  } catch (const boost::system::system_error &e) {
    log::error("SqlTask '{}': spawn failed: {}", id_, e.what());
    return task_failed(make_error_code(Error::ProcessSpawnFailed), e.what());
  }

  if (outcome.timed_out) {
    return task_failed(make_error_code(Error::Timeout),
                       std::format("{} timed out after {}s", binary,
                                   config_.timeout.count()));
  }
  if (outcome.exit_code != 0) {
    return task_failed(std::format(
        "{} exited with code {}: {}", binary, outcome.exit_code,
        boost::algorithm::trim_copy(outcome.stderr_output)));
  }

  return JsonValue{
      {"exit_code", static_cast<std::int64_t>(outcome.exit_code)},
      {"stdout", std::move(outcome.stdout_output)},
      {"stderr", std::move(outcome.stderr_output)},
  };
}

auto SqlTask::clone() const -> std::unique_ptr<ITask> {
  return std::make_unique<SqlTask>(id_, config_, declared_);
}

} // namespace dagweave
