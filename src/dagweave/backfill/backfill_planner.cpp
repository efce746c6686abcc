#include "dagweave/backfill/backfill_planner.hpp"

#include "dagweave/params/date_expr.hpp"
#include "dagweave/util/log.hpp"
#include "dagweave/util/time.hpp"

#include <boost/algorithm/string/join.hpp>

#include <exception>
#include <format>
#include <string_view>
#include <utility>

namespace dagweave {

namespace {

constexpr std::string_view kDefaultDateFormat = "%Y-%m-%d";

// `${<token><+|-><N>}` covering the whole value.
[[nodiscard]] auto parse_template_date(const ParamValue &value)
    -> std::optional<DateExpr> {
  const auto *text = std::get_if<std::string>(&value);
  if (text == nullptr || text->size() < 4 || !text->starts_with("${") ||
      !text->ends_with('}')) {
    return std::nullopt;
  }
  return parse_date_expr(std::string_view(*text).substr(2, text->size() - 3));
}

[[nodiscard]] auto toml_quote(std::string_view value) -> std::string {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

[[nodiscard]] auto toml_array(const std::vector<std::string> &values)
    -> std::string {
  std::vector<std::string> quoted;
  quoted.reserve(values.size());
  for (const auto &v : values) {
    quoted.emplace_back(toml_quote(v));
  }
  return std::format("[{}]", boost::algorithm::join(quoted, ", "));
}

} // namespace

BackfillPlanner::BackfillPlanner(ExecutionEngine &engine, ConfirmFn confirm)
    : engine_(engine), confirm_(std::move(confirm)) {}

auto BackfillPlanner::plan(const DateSpec &spec)
    -> Result<std::vector<std::chrono::sys_days>> {
  using namespace std::chrono;
  std::vector<sys_days> out;

  if (!spec.dates.empty()) {
    out.reserve(spec.dates.size());
    for (const auto &text : spec.dates) {
      auto day = util::parse_day(text);
      if (!day) {
        log::error("Backfill: cannot parse date '{}'", text);
        return fail(Error::InvalidDateRange);
      }
      out.emplace_back(*day);
    }
    return ok(std::move(out));
  }

  auto start = util::parse_day(spec.start_date);
  auto end = util::parse_day(spec.end_date);
  if (!start || !end) {
    log::error("Backfill: invalid date range '{}'..'{}'", spec.start_date,
               spec.end_date);
    return fail(Error::InvalidDateRange);
  }
  if (*end < *start) {
    log::error("Backfill: end date {} is before start date {}", spec.end_date,
               spec.start_date);
    return fail(Error::InvalidDateRange);
  }

  switch (spec.granularity) {
  case Granularity::Week: {
    const weekday wd{*start};
    for (auto d = *start - days{wd.iso_encoding() - 1}; d <= *end;
         d += days{7}) {
      out.emplace_back(d);
    }
    break;
  }
  case Granularity::Month: {
    const year_month_day ymd{*start};
    for (auto ym = ymd.year() / ymd.month(); sys_days{ym / 1} <= *end;
         ym += months{1}) {
      out.emplace_back(sys_days{ym / 1});
    }
    break;
  }
  case Granularity::Day:
  default:
    for (auto d = *start; d <= *end; d += days{1}) {
      out.emplace_back(d);
    }
    break;
  }
  return ok(std::move(out));
}

auto BackfillPlanner::build_params(std::chrono::sys_days date,
                                   const BackfillRequest &request)
    -> ParamMap {
  ParamMap out;
  // The date point is a plain calendar date; no zone applies to it.
  const util::CivilTime base{.day = date};

  for (const auto &name : request.date_param_names) {
    std::string_view pattern = kDefaultDateFormat;
    if (auto it = request.date_param_formats.find(name);
        it != request.date_param_formats.end() && !it->second.empty()) {
      pattern = it->second;
    }
    auto value = util::format_civil(base, pattern);
    if (value.empty()) {
      log::warn("Backfill: date format '{}' for '{}' produced no output; "
                "using {}",
                pattern, name, kDefaultDateFormat);
      value = util::format_civil(base, kDefaultDateFormat);
    }
    out.insert_or_assign(name, std::move(value));
  }
  for (const auto &name : request.date_param_names) {
    auto no_dash = std::format("{}_no_dash", name);
    if (!out.contains(no_dash)) {
      const auto &value = std::get<std::string>(out.at(name));
      out.insert_or_assign(std::move(no_dash), util::strip_dashes(value));
    }
  }

  for (const auto &[key, value] : request.template_params) {
    auto expr = parse_template_date(value);
    if (!expr) {
      out.insert_or_assign(key, value);
      continue;
    }
    auto rewritten = evaluate_date_expr(*expr, base);
    log::debug("Backfill {}: template '{}' -> '{}'", util::format_day(date),
               key, rewritten);
    if (rewritten.find('-') != std::string::npos) {
      out.insert_or_assign(std::format("{}_no_dash", key),
                           util::strip_dashes(rewritten));
    }
    out.insert_or_assign(key, std::move(rewritten));
  }

  for (const auto &[key, value] : request.custom_params) {
    out.insert_or_assign(key, value);
  }
  return out;
}

// Builds a fresh graph and store for one date point and runs it. Sets the
// outcome status and, on failure, its error text.
auto BackfillPlanner::run_date_point(const BackfillRequest &request,
                                     DatePointOutcome &outcome) -> void {
  auto graph = request.graph_factory();
  if (!graph) {
    outcome.status = RunState::Failed;
    outcome.error =
        std::format("graph construction failed: {}", graph.error().message());
    return;
  }

  ParameterStore store;
  store.set(outcome.params);
  auto result = engine_.execute(
      *graph, store,
      RunOptions{.start_from = request.start_from,
                 .end_at = std::nullopt,
                 .only_tasks = request.only_tasks,
                 .fail_fast = request.fail_fast,
                 .date_point = outcome.date});
  if (result) {
    outcome.status = RunState::Success;
    return;
  }
  outcome.status = RunState::Failed;
  auto record = engine_.last_record();
  outcome.error = record && record->failed_task
                      ? std::format("{}: {}", *record->failed_task,
                                    record->error_message)
                      : result.error().message();
}

auto BackfillPlanner::run(const BackfillRequest &request)
    -> Result<BackfillReport> {
  const auto started = std::chrono::steady_clock::now();

  auto planned = plan(request.date_spec);
  if (!planned) {
    return fail(planned.error());
  }
  if (!request.graph_factory) {
    log::error("Backfill: no graph factory configured");
    return fail(Error::InvalidArgument);
  }

  BackfillReport report;
  report.planned = *planned;
  report.dry_run = request.dry_run;

  log::info("Backfill: {} date point(s){}", report.planned.size(),
            request.dry_run ? " (dry run)" : "");

  if (!request.dry_run && !request.auto_confirm) {
    if (!confirm_ || !confirm_(report.planned)) {
      log::warn("Backfill cancelled before execution");
      return fail(Error::Cancelled);
    }
  }

  for (const auto date : report.planned) {
    const auto label = util::format_day(date);
    DatePointOutcome outcome{.date = date,
                             .status = RunState::Pending,
                             .params = build_params(date, request),
                             .error = {}};

    if (request.dry_run) {
      for (const auto &[key, value] : outcome.params) {
        log::info("[{}] dry run: {} = {}", label, key, param_to_string(value));
      }
      report.outcomes.emplace_back(std::move(outcome));
      continue;
    }

    try {
      run_date_point(request, outcome);
    } catch (const std::exception &e) {
      outcome.status = RunState::Failed;
      outcome.error = e.what();
    } catch (...) {
      outcome.status = RunState::Failed;
      outcome.error = "unknown exception";
    }

    if (outcome.status == RunState::Success) {
      ++report.succeeded;
      log::info("[{}] backfill succeeded", label);
    } else {
      ++report.failed;
      report.failed_dates.emplace_back(date);
      log::error("[{}] backfill failed: {}", label, outcome.error);
    }
    report.outcomes.emplace_back(std::move(outcome));
  }

  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  log::info("Backfill finished in {}ms: {} succeeded, {} failed",
            report.elapsed.count(), report.succeeded, report.failed);
  return ok(std::move(report));
}

auto render_rerun_config(const BackfillReport &report,
                         const BackfillRequest &request) -> std::string {
  std::vector<std::string> dates;
  dates.reserve(report.failed_dates.size());
  for (const auto day : report.failed_dates) {
    dates.emplace_back(util::format_day(day));
  }

  auto out = std::format("custom_dates = {}\ndate_param_names = {}\n"
                         "dry_run = false\n",
                         toml_array(dates),
                         toml_array(request.date_param_names));
  if (!request.date_param_formats.empty()) {
    out += "\n[date_param_formats]\n";
    for (const auto &[name, pattern] : request.date_param_formats) {
      out += std::format("{} = {}\n", name, toml_quote(pattern));
    }
  }
  return out;
}

} // namespace dagweave
