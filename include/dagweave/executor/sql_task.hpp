#pragma once

#include "dagweave/scheduler/task.hpp"
#include "dagweave/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dagweave {

enum class SqlEngine : std::uint8_t {
  Hive,
  SparkSql,
};
BOOST_DESCRIBE_ENUM(SqlEngine, Hive, SparkSql)
DAGWEAVE_DEFINE_ENUM_SERDE(SqlEngine, SqlEngine::Hive)

// "hive" or "spark-sql".
[[nodiscard]] auto default_engine_binary(SqlEngine engine) -> std::string_view;

struct SqlTaskConfig {
  SqlEngine engine{SqlEngine::Hive};
  // Empty selects default_engine_binary(engine) from PATH.
  std::string engine_binary;
  // Exactly one of `sql` and `sql_file` is set.
  std::string sql;
  std::string sql_file;
  // Passed as --hiveconf (hive) or --conf (spark-sql); values may hold ${...}.
  std::map<std::string, std::string> conf;
  // Loaded with -i before the statement file.
  std::vector<std::string> init_files;
  // Also the base of relative sql_file and init_files paths.
  std::string working_dir;
  // Zero disables the limit.
  std::chrono::seconds timeout{0};
};

/// Runs SQL through the Hive or Spark SQL command line client.
///
/// `${name}` references in the statement text (inline or read from
/// `sql_file`) and in `conf` values are resolved like a shell command: task
/// parameters first, then the run's store. References the store cannot
/// resolve, such as Hive's own `${hivevar:x}`, are passed through untouched.
/// The resolved text is written to a temporary file and run with
///
///   <engine> [-i init]... [--hiveconf|--conf k=v]... -f <file>
///            [--hivevar name=value]...
///
/// where the `--hivevar` pairs are the task's resolved parameters.
/// Result: {"exit_code": int, "stdout": str, "stderr": str}.
class SqlTask final : public TaskBase {
public:
  SqlTask(TaskId id, SqlTaskConfig config, ParamMap params = {});

  [[nodiscard]] auto kind() const noexcept -> TaskKind override {
    return TaskKind::Sql;
  }

  [[nodiscard]] auto resolve_params(const ParameterStore &store)
      -> Result<void> override;
  [[nodiscard]] auto execute(const UpstreamResults &upstream)
      -> TaskResult override;
  [[nodiscard]] auto clone() const -> std::unique_ptr<ITask> override;

  [[nodiscard]] auto config() const noexcept -> const SqlTaskConfig & {
    return config_;
  }
  [[nodiscard]] auto resolved_sql() const noexcept -> const std::string & {
    return resolved_sql_;
  }

  // Arguments after the engine binary, with `statement_file` as the -f target.
  [[nodiscard]] auto engine_arguments(const std::string &statement_file) const
      -> std::vector<std::string>;

private:
  [[nodiscard]] auto load_statement() const -> Result<std::string>;
  [[nodiscard]] auto in_working_dir(const std::string &path) const
      -> std::string;

  SqlTaskConfig config_;
  std::string resolved_sql_;
  std::map<std::string, std::string> resolved_conf_;
};

} // namespace dagweave
