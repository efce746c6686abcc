#include "dagweave/config/backfill_config.hpp"
#include "dagweave/config/toml_util.hpp"

#include "dagweave/util/log.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <map>
#include <string>
#include <vector>

namespace dagweave {
namespace detail {

struct BackfillToml {
  std::string start_date;
  std::string end_date;
  std::string date_granularity{"day"};
  std::vector<std::string> custom_dates;
  std::string date_param_name{"day_id"};
  std::vector<std::string> date_param_names;
  std::map<std::string, std::string> date_param_formats;
  bool fail_fast{true};
  bool dry_run{false};
  toml_util::ParamTable params;
};

} // namespace detail
} // namespace dagweave

namespace glz {
template <> struct meta<dagweave::detail::BackfillToml> {
  using T = dagweave::detail::BackfillToml;
  static constexpr auto value = object(
      "start_date", &T::start_date, "end_date", &T::end_date,
      "date_granularity", &T::date_granularity, "custom_dates",
      &T::custom_dates, "date_param_name", &T::date_param_name,
      "date_param_names", &T::date_param_names, "date_param_formats",
      &T::date_param_formats, "fail_fast", &T::fail_fast, "dry_run",
      &T::dry_run, "params", &T::params);
};
} // namespace glz

namespace dagweave {
namespace {

auto set_diagnostic(std::string *diagnostic, std::string text) -> void {
  log::error("Backfill config: {}", text);
  if (diagnostic) {
    *diagnostic = std::move(text);
  }
}

[[nodiscard]] auto convert_toml(std::string_view text, std::string *diagnostic)
    -> Result<BackfillRequest> {
  auto raw_result =
      toml_util::parse_toml<detail::BackfillToml>(text, diagnostic);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  if (!util::is_enum_name<Granularity>(raw.date_granularity)) {
    set_diagnostic(diagnostic,
                   std::format("unknown date_granularity '{}'",
                               raw.date_granularity));
    return fail(Error::InvalidArgument);
  }
  if (raw.custom_dates.empty() &&
      (raw.start_date.empty() || raw.end_date.empty())) {
    set_diagnostic(diagnostic,
                   "either custom_dates or start_date and end_date are "
                   "required");
    return fail(Error::InvalidDateRange);
  }

  BackfillRequest request{};
  request.date_spec = DateSpec{
      .dates = std::move(raw.custom_dates),
      .start_date = std::move(raw.start_date),
      .end_date = std::move(raw.end_date),
      .granularity = parse<Granularity>(raw.date_granularity)};

  if (!raw.date_param_names.empty()) {
    request.date_param_names = std::move(raw.date_param_names);
  } else if (!raw.date_param_name.empty()) {
    request.date_param_names = {std::move(raw.date_param_name)};
  }
  for (auto &[name, pattern] : raw.date_param_formats) {
    request.date_param_formats.insert_or_assign(name, std::move(pattern));
  }
  request.custom_params = toml_util::to_param_map(raw.params);
  request.fail_fast = raw.fail_fast;
  request.dry_run = raw.dry_run;
  return ok(std::move(request));
}

} // namespace

auto BackfillConfigLoader::load_from_file(std::string_view path,
                                          std::string *diagnostic)
    -> Result<BackfillRequest> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = text.error().message();
    }
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto BackfillConfigLoader::load_from_string(std::string_view toml_str,
                                            std::string *diagnostic)
    -> Result<BackfillRequest> {
  try {
    return convert_toml(toml_str, diagnostic);
  } catch (const std::exception &e) {
    log::error("Failed to parse backfill configuration: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

} // namespace dagweave
