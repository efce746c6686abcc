#pragma once

#include "dagweave/config/config.hpp"
#include "dagweave/core/error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dagweave::cli {

struct GlobalOptions {
  std::string config_file;
  std::optional<std::string> log_level;
};

struct RunWorkflowOptions {
  GlobalOptions global;
  std::string workflow_file;
  std::optional<std::string> params_file;
  std::optional<std::string> start_from;
  std::optional<std::string> end_at;
  std::vector<std::string> only;
  bool no_fail_fast{false};
  std::optional<std::size_t> parallelism;
  bool json{false};
};

struct BackfillOptions {
  GlobalOptions global;
  std::string workflow_file;
  std::string backfill_file;
  std::vector<std::string> only;
  std::optional<std::string> start_from;
  std::optional<std::size_t> parallelism;
  std::optional<std::string> rerun_file; // failed dates are written here
  bool auto_confirm{false};
  bool dry_run{false};
};

struct InfoOptions {
  GlobalOptions global;
  std::string workflow_file;
  bool json{false};
};

struct ValidateOptions {
  GlobalOptions global;
  std::string workflow_file;
  bool json{false};
};

// Loads -c (defaults when absent) and configures the logger. The
// --log-level flag wins over the file; `apply_file_level` lets commands with
// quiet output keep the CLI default level.
[[nodiscard]] auto setup_logging(const GlobalOptions &opts,
                                 bool apply_file_level) -> Result<SystemConfig>;

[[nodiscard]] auto cmd_run(const RunWorkflowOptions &opts) -> int;
[[nodiscard]] auto cmd_backfill(const BackfillOptions &opts) -> int;
[[nodiscard]] auto cmd_info(const InfoOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;

} // namespace dagweave::cli
