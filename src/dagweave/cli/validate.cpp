#include "dagweave/cli/commands.hpp"
#include "dagweave/cli/formatting.hpp"
#include "dagweave/config/workflow_definition.hpp"
#include "dagweave/util/json.hpp"

#include <cstdint>
#include <print>
#include <string>

namespace dagweave::cli {

auto cmd_validate(const ValidateOptions &opts) -> int {
  if (!setup_logging(opts.global, /*apply_file_level=*/false)) {
    return 1;
  }

  std::string diagnostic;
  auto res =
      WorkflowLoader::load_from_file(opts.workflow_file, &diagnostic)
          .and_then([](const WorkflowDefinition &def) -> Result<std::size_t> {
            auto graph = def.build_graph();
            if (!graph) {
              return fail(graph.error());
            }
            auto levels = graph->levels();
            if (!levels) {
              return fail(levels.error());
            }
            return ok(levels->size());
          });

  const bool valid = res.has_value();
  std::string error;
  if (!valid) {
    error = diagnostic.empty() ? res.error().message() : diagnostic;
  }

  if (opts.json) {
    JsonValue output{
        {"file", opts.workflow_file},
        {"valid", valid},
    };
    if (valid) {
      output.get_object().emplace("levels", static_cast<std::int64_t>(*res));
    } else {
      output.get_object().emplace("error", error);
    }
    std::println("{}", dump_json(output));
  } else if (valid) {
    std::println("{} {} - {} ({} level(s))", fmt::ansi::green("✓"),
                 opts.workflow_file, fmt::ansi::green("Valid"), *res);
  } else {
    std::println("{} {} - {}", fmt::ansi::red("✗"), opts.workflow_file,
                 fmt::ansi::red(error));
  }
  return valid ? 0 : 1;
}

} // namespace dagweave::cli
