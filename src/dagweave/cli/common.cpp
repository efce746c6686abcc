#include "dagweave/cli/commands.hpp"

#include "dagweave/util/log.hpp"

#include <print>

namespace dagweave::cli {

auto setup_logging(const GlobalOptions &opts, bool apply_file_level)
    -> Result<SystemConfig> {
  SystemConfig config{};
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: cannot load config '{}': {}",
                   opts.config_file, loaded.error().message());
      return fail(loaded.error());
    }
    config = std::move(*loaded);
  }

  if (!config.scheduler.log_file.empty() &&
      !log::set_output_file(config.scheduler.log_file)) {
    std::println(stderr, "Warning: cannot open log file '{}', logging to "
                         "stderr",
                 config.scheduler.log_file);
  }

  if (opts.log_level) {
    if (!log::is_level_name(*opts.log_level)) {
      std::println(stderr, "Error: unknown log level '{}'", *opts.log_level);
      return fail(Error::InvalidArgument);
    }
    log::set_level(*opts.log_level);
  } else if (apply_file_level) {
    log::set_level(config.scheduler.log_level);
  }
  return ok(std::move(config));
}

} // namespace dagweave::cli
