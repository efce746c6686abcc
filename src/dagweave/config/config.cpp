#include "dagweave/config/config.hpp"
#include "dagweave/config/toml_util.hpp"

#include "dagweave/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace dagweave {
namespace detail {

// Mirrors the file layout; glaze reflects these aggregates directly.
// max_parallelism is signed so that a negative value reaches validation.
struct SchedulerSection {
  std::string log_level{"info"};
  std::string log_file;
  std::int64_t max_parallelism{1};
};

struct SystemFile {
  SchedulerSection scheduler{};
};

} // namespace detail

namespace {

using detail::SchedulerSection;
using detail::SystemFile;

[[nodiscard]] auto env(const char *name) -> const char * {
  return std::getenv(name);
}

// Throws boost::bad_lexical_cast for a non-numeric parallelism override.
auto apply_env_overrides(SchedulerSection &s) -> void {
  if (const char *v = env("DAGWEAVE_LOG_LEVEL")) {
    s.log_level = v;
  }
  if (const char *v = env("DAGWEAVE_LOG_FILE")) {
    s.log_file = v;
  }
  if (const char *v = env("DAGWEAVE_MAX_PARALLELISM")) {
    s.max_parallelism = boost::lexical_cast<std::int64_t>(v);
  }
}

[[nodiscard]] auto validate(const SchedulerSection &s) -> Result<void> {
  if (s.max_parallelism < 1) {
    log::error("scheduler.max_parallelism must be at least 1, got {}",
               s.max_parallelism);
    return fail(Error::ParseError);
  }
  if (!log::is_level_name(s.log_level)) {
    log::error("scheduler.log_level '{}' is not one of "
               "trace/debug/info/warn/error/off",
               s.log_level);
    return fail(Error::ParseError);
  }
  return ok();
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  return toml_util::read_file(path).and_then(
      [](const std::string &text) { return load_from_string(text); });
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  auto parsed = toml_util::parse_toml<SystemFile>(toml_str);
  if (!parsed) {
    return fail(parsed.error());
  }
  auto &section = parsed->scheduler;

  try {
    apply_env_overrides(section);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("DAGWEAVE_MAX_PARALLELISM is not a number: {}", e.what());
    return fail(Error::ParseError);
  }
  if (auto valid = validate(section); !valid) {
    return fail(valid.error());
  }

  return ok(SystemConfig{
      .scheduler = {.log_level = std::move(section.log_level),
                    .log_file = std::move(section.log_file),
                    .max_parallelism =
                        static_cast<std::size_t>(section.max_parallelism)}});
}

} // namespace dagweave
