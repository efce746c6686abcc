#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace dagweave {

struct ProcessOutcome {
  int exit_code{-1};
  bool timed_out{false};
  std::string stdout_output;
  std::string stderr_output;
};

// Runs `program args...` with both output streams captured (each capped at
// 10 MiB). A program without a '/' is looked up on PATH. A zero timeout
// waits indefinitely; on expiry the child is terminated.
// Throws boost::system::system_error when the process cannot be started.
[[nodiscard]] auto run_process(const std::string &program,
                               const std::vector<std::string> &args,
                               const std::string &working_dir,
                               std::chrono::seconds timeout) -> ProcessOutcome;

// First 120 characters of a command line, for log lines.
[[nodiscard]] auto command_preview(std::string_view command) -> std::string;

} // namespace dagweave
