#include "dagweave/cli/commands.hpp"
#include "dagweave/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("DAGWEAVE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_global_options(CLI::App *cmd, dagweave::cli::GlobalOptions &opts)
    -> void {
  opts.config_file = default_config();
  cmd->add_option("-c,--config", opts.config_file, "System config file")
      ->check(CLI::ExistingFile);
  cmd->add_option("--log-level", opts.log_level,
                  "Log level override: trace|debug|info|warn|error|off");
}
} // namespace

int main(int argc, char *argv[]) {
  // Logs go to stderr so that --json output stays machine readable.
  dagweave::log::set_output_stderr();
  dagweave::log::set_level(dagweave::log::Level::Warn);

  CLI::App app{"DAGWeave", "A dependency-graph job scheduler with backfill"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  dagweave run -w workflow.toml\n"
             "  dagweave backfill -w workflow.toml -b backfill.toml -y\n"
             "\nTip: Set DAGWEAVE_CONFIG=system_config.toml to skip -c on "
             "every command.");

  dagweave::cli::RunWorkflowOptions run_opts;
  auto *run = app.add_subcommand("run", "Run a workflow once");
  run->footer("\nExamples:\n"
              "  dagweave run -w workflow.toml\n"
              "  dagweave run -w workflow.toml --start-from transform\n"
              "  dagweave run -w workflow.toml --only load,report -j 4");
  add_global_options(run, run_opts.global);
  run->add_option("-w,--workflow", run_opts.workflow_file, "Workflow file")
      ->required()
      ->check(CLI::ExistingFile);
  run->add_option("--params", run_opts.params_file,
                  "TOML file whose [params] override workflow params")
      ->check(CLI::ExistingFile);
  run->add_option("--start-from", run_opts.start_from,
                  "Run this task and everything downstream of it");
  run->add_option("--end-at", run_opts.end_at,
                  "Run this task and everything upstream of it");
  run->add_option("--only", run_opts.only, "Comma-separated task subset")
      ->delimiter(',');
  run->add_flag("--no-fail-fast", run_opts.no_fail_fast,
                "Keep running remaining tasks after a failure");
  run->add_option("-j,--parallelism", run_opts.parallelism,
                  "Tasks run concurrently within a level")
      ->check(CLI::PositiveNumber);
  run->add_flag("--json", run_opts.json, "Output the run record as JSON");
  run->callback(
      [&run_opts]() { std::exit(dagweave::cli::cmd_run(run_opts)); });

  dagweave::cli::BackfillOptions backfill_opts;
  auto *backfill =
      app.add_subcommand("backfill", "Run a workflow over a range of dates");
  backfill->footer(
      "\nExamples:\n"
      "  dagweave backfill -w workflow.toml -b backfill.toml\n"
      "  dagweave backfill -w workflow.toml -b backfill.toml -y "
      "--rerun-file failed.toml");
  add_global_options(backfill, backfill_opts.global);
  backfill
      ->add_option("-w,--workflow", backfill_opts.workflow_file,
                   "Workflow file")
      ->required()
      ->check(CLI::ExistingFile);
  backfill
      ->add_option("-b,--backfill", backfill_opts.backfill_file,
                   "Backfill parameter file")
      ->required()
      ->check(CLI::ExistingFile);
  backfill->add_option("--only", backfill_opts.only,
                       "Comma-separated task subset")
      ->delimiter(',');
  backfill->add_option("--start-from", backfill_opts.start_from,
                       "Run this task and everything downstream of it");
  backfill->add_option("-j,--parallelism", backfill_opts.parallelism,
                       "Tasks run concurrently within a level")
      ->check(CLI::PositiveNumber);
  backfill->add_option("--rerun-file", backfill_opts.rerun_file,
                       "Write a backfill file for the failed dates");
  backfill->add_flag("-y,--auto-confirm", backfill_opts.auto_confirm,
                     "Do not ask for confirmation");
  backfill->add_flag("--dry-run", backfill_opts.dry_run,
                     "Print per-date parameters without running tasks");
  backfill->callback([&backfill_opts]() {
    std::exit(dagweave::cli::cmd_backfill(backfill_opts));
  });

  dagweave::cli::InfoOptions info_opts;
  auto *info = app.add_subcommand("info", "Show tasks and execution levels");
  add_global_options(info, info_opts.global);
  info->add_option("-w,--workflow", info_opts.workflow_file, "Workflow file")
      ->required()
      ->check(CLI::ExistingFile);
  info->add_flag("--json", info_opts.json, "Output JSON");
  info->callback(
      [&info_opts]() { std::exit(dagweave::cli::cmd_info(info_opts)); });

  dagweave::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand("validate", "Validate a workflow file");
  add_global_options(validate, validate_opts.global);
  validate
      ->add_option("-w,--workflow", validate_opts.workflow_file,
                   "Workflow file")
      ->required()
      ->check(CLI::ExistingFile);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(dagweave::cli::cmd_validate(validate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
