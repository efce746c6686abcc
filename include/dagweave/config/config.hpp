#pragma once

#include "dagweave/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace dagweave {

// [scheduler] table of the system configuration file.
struct SchedulerConfig {
  std::string log_level{"info"};
  // Empty means stdout.
  std::string log_file;
  std::size_t max_parallelism{1};

  auto operator==(const SchedulerConfig &) const -> bool = default;
};

struct SystemConfig {
  SchedulerConfig scheduler;

  auto operator==(const SystemConfig &) const -> bool = default;
};

// Missing keys keep their defaults. The environment wins over the file:
//   DAGWEAVE_LOG_LEVEL, DAGWEAVE_LOG_FILE, DAGWEAVE_MAX_PARALLELISM
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
};

} // namespace dagweave
