#pragma once

#include "dagweave/backfill/backfill_planner.hpp"
#include "dagweave/core/error.hpp"

#include <string>
#include <string_view>

namespace dagweave {

// Reads a backfill parameter file into a request. The file's `[params]`
// become custom params; template params, the graph factory and the task
// scope are left for the caller to fill in.
class BackfillConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<BackfillRequest>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<BackfillRequest>;
};

} // namespace dagweave
