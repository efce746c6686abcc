#pragma once

#include "dagweave/core/error.hpp"
#include "dagweave/dag/dag.hpp"
#include "dagweave/params/parameter_store.hpp"
#include "dagweave/scheduler/engine.hpp"
#include "dagweave/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dagweave {

enum class Granularity : std::uint8_t { Day, Week, Month };
BOOST_DESCRIBE_ENUM(Granularity, Day, Week, Month)
DAGWEAVE_DEFINE_ENUM_SERDE(Granularity, Granularity::Day)

// Either an explicit date list, or start/end dates (YYYY-MM-DD) expanded at
// the given granularity. A non-empty explicit list wins.
struct DateSpec {
  std::vector<std::string> dates;
  std::string start_date;
  std::string end_date;
  Granularity granularity{Granularity::Day};
};

using DateFormatMap = NameMap<std::string>;

struct BackfillRequest {
  DateSpec date_spec;
  std::vector<std::string> date_param_names{"day_id"};
  // strftime pattern per date parameter name; default %Y-%m-%d.
  DateFormatMap date_param_formats;
  ParamMap template_params;
  ParamMap custom_params;
  GraphFactory graph_factory;
  std::optional<std::vector<TaskId>> only_tasks;
  std::optional<TaskId> start_from;
  bool fail_fast{true};
  bool dry_run{false};
  bool auto_confirm{false};
};

struct DatePointOutcome {
  std::chrono::sys_days date;
  RunState status{RunState::Pending};
  ParamMap params;
  std::string error;
};

struct BackfillReport {
  std::vector<std::chrono::sys_days> planned;
  std::vector<DatePointOutcome> outcomes;
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::vector<std::chrono::sys_days> failed_dates;
  bool dry_run{false};
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] auto ok() const noexcept -> bool {
    return failed_dates.empty();
  }
};

// Asked once, before the first date point runs.
using ConfirmFn = std::function<bool(std::span<const std::chrono::sys_days>)>;

class BackfillPlanner {
public:
  explicit BackfillPlanner(ExecutionEngine &engine, ConfirmFn confirm = {});

  // Fails with Error::InvalidDateRange for unparsable dates or end < start.
  [[nodiscard]] static auto plan(const DateSpec &spec)
      -> Result<std::vector<std::chrono::sys_days>>;

  // Date parameters, rewritten templates and custom params for one date
  // point, merged in that order.
  [[nodiscard]] static auto build_params(std::chrono::sys_days date,
                                         const BackfillRequest &request)
      -> ParamMap;

  // A failing date point is recorded and the loop moves on; the returned
  // error is reserved for planning failures and a declined confirmation.
  [[nodiscard]] auto run(const BackfillRequest &request)
      -> Result<BackfillReport>;

private:
  auto run_date_point(const BackfillRequest &request,
                      DatePointOutcome &outcome) -> void;

  ExecutionEngine &engine_;
  ConfirmFn confirm_;
};

// TOML snippet that re-runs only the failed date points.
[[nodiscard]] auto render_rerun_config(const BackfillReport &report,
                                       const BackfillRequest &request)
    -> std::string;

} // namespace dagweave
