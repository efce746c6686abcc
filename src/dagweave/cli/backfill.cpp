#include "dagweave/alert/alert_sink.hpp"
#include "dagweave/backfill/backfill_planner.hpp"
#include "dagweave/cli/commands.hpp"
#include "dagweave/cli/formatting.hpp"
#include "dagweave/config/backfill_config.hpp"
#include "dagweave/config/workflow_definition.hpp"
#include "dagweave/util/log.hpp"
#include "dagweave/util/time.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <chrono>
#include <cstdio>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <print>
#include <span>
#include <string>
#include <vector>

namespace dagweave::cli {

namespace {

constexpr std::size_t kPreviewDates = 10;

auto confirm_on_stdin(std::span<const std::chrono::sys_days> dates) -> bool {
  std::println("About to backfill {} date point(s):", dates.size());
  for (std::size_t i = 0; i < dates.size() && i < kPreviewDates; ++i) {
    std::println("  {}", util::format_day(dates[i]));
  }
  if (dates.size() > kPreviewDates) {
    std::println("  ... ({} more, last {})", dates.size() - kPreviewDates,
                 util::format_day(dates.back()));
  }
  std::print("Continue? [y/N] ");
  std::fflush(stdout);

  std::string answer;
  if (!std::getline(std::cin, answer)) {
    return false;
  }
  boost::algorithm::trim(answer);
  boost::algorithm::to_lower(answer);
  return answer == "y" || answer == "yes";
}

auto print_report(const BackfillReport &report,
                  const BackfillRequest &request) -> void {
  std::println("");
  if (report.dry_run) {
    std::println("{} {} date point(s) planned, nothing executed",
                 fmt::ansi::bold("Dry run:"), report.planned.size());
    for (const auto &outcome : report.outcomes) {
      std::println("  {}", util::format_day(outcome.date));
      for (const auto &[key, value] : outcome.params) {
        std::println("    {} = {}", key, param_to_string(value));
      }
    }
    return;
  }

  std::println("{} {} planned, {} succeeded, {} failed in {}",
               fmt::ansi::bold("Backfill:"), report.planned.size(),
               fmt::ansi::green(std::format("{}", report.succeeded)),
               report.failed > 0
                   ? fmt::ansi::red(std::format("{}", report.failed))
                   : std::format("{}", report.failed),
               fmt::format_duration(report.elapsed));
  if (report.ok()) {
    return;
  }

  std::println("\nFailed dates:");
  for (const auto &outcome : report.outcomes) {
    if (outcome.status == RunState::Failed) {
      std::println("  {} {}", util::format_day(outcome.date),
                   fmt::ansi::red(outcome.error));
    }
  }
  std::println("\nRerun the failed dates with this backfill file:\n");
  std::print("{}", render_rerun_config(report, request));
}

} // namespace

auto cmd_backfill(const BackfillOptions &opts) -> int {
  auto config = setup_logging(opts.global, /*apply_file_level=*/true);
  if (!config) {
    return 1;
  }

  std::string diagnostic;
  auto def = WorkflowLoader::load_from_file(opts.workflow_file, &diagnostic);
  if (!def) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? def.error().message() : diagnostic);
    return 1;
  }

  diagnostic.clear();
  auto request =
      BackfillConfigLoader::load_from_file(opts.backfill_file, &diagnostic);
  if (!request) {
    std::println(stderr, "Error: {}",
                 diagnostic.empty() ? request.error().message() : diagnostic);
    return 1;
  }

  request->template_params = def->params;
  request->graph_factory = def->make_graph_factory();
  request->fail_fast = request->fail_fast && def->fail_fast;
  request->auto_confirm = opts.auto_confirm;
  request->dry_run = request->dry_run || opts.dry_run;
  if (opts.start_from) {
    request->start_from = TaskId(*opts.start_from);
  }
  if (!opts.only.empty()) {
    std::vector<TaskId> only;
    only.reserve(opts.only.size());
    for (const auto &id : opts.only) {
      only.emplace_back(id);
    }
    request->only_tasks = std::move(only);
  }

  ExecutionEngine engine(
      EngineOptions{.workflow_name = def->name,
                    .max_parallelism = opts.parallelism.value_or(
                        config->scheduler.max_parallelism)},
      std::make_shared<LogAlertSink>());
  BackfillPlanner planner(engine, confirm_on_stdin);

  auto report = planner.run(*request);
  if (!report) {
    if (report.error() == make_error_code(Error::Cancelled)) {
      std::println("Backfill cancelled.");
    } else {
      std::println(stderr, "Error: {}", report.error().message());
    }
    return 1;
  }

  print_report(*report, *request);

  if (opts.rerun_file && !report->ok()) {
    std::ofstream out(*opts.rerun_file, std::ios::trunc);
    if (!out) {
      std::println(stderr, "Error: cannot write '{}'", *opts.rerun_file);
      return 1;
    }
    out << render_rerun_config(*report, *request);
    std::println("\nRerun file written to {}", *opts.rerun_file);
  }
  return report->ok() ? 0 : 1;
}

} // namespace dagweave::cli
