#include "dagweave/executor/process_runner.hpp"

#include "dagweave/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <optional>
#include <utility>

namespace dagweave {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxOutputSize = 10UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kCommandPreview = 120;

// Drains one pipe until EOF; output beyond kMaxOutputSize is dropped but
// still read so the child never blocks on a full pipe.
class PipeCollector {
public:
  PipeCollector(boost::asio::readable_pipe &pipe, std::string &out)
      : pipe_(pipe), out_(out) {}

  auto start() -> void {
    pipe_.async_read_some(
        boost::asio::buffer(buffer_.data(), buffer_.size()),
        [this](const boost::system::error_code &ec, std::size_t bytes) {
          if (ec) {
            return;
          }
          if (out_.size() < kMaxOutputSize) {
            const auto room = kMaxOutputSize - out_.size();
            out_.append(buffer_.data(), std::min(room, bytes));
          }
          start();
        });
  }

private:
  boost::asio::readable_pipe &pipe_;
  std::string &out_;
  std::array<char, kReadBufferSize> buffer_{};
};

[[nodiscard]] auto locate_program(const std::string &program)
    -> bp::filesystem::path {
  if (program.find('/') != std::string::npos) {
    return program;
  }
  auto found = bp::environment::find_executable(program);
  if (found.empty()) {
    throw boost::system::system_error(
        boost::system::errc::make_error_code(
            boost::system::errc::no_such_file_or_directory),
        std::format("'{}' not found on PATH", program));
  }
  return found;
}

} // namespace

auto run_process(const std::string &program,
                 const std::vector<std::string> &args,
                 const std::string &working_dir, std::chrono::seconds timeout)
    -> ProcessOutcome {
  const auto executable = locate_program(program);

  boost::asio::io_context io;
  boost::asio::readable_pipe stdout_pipe(io);
  boost::asio::readable_pipe stderr_pipe(io);
  ProcessOutcome outcome;

  auto stdio =
      bp::process_stdio{.in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
  std::optional<bp::process> proc;
  if (working_dir.empty()) {
    proc.emplace(io, executable, args, std::move(stdio));
  } else {
    proc.emplace(io, executable, args, std::move(stdio),
                 bp::process_start_dir{working_dir});
  }
  log::debug("process '{}' started pid={}", executable.string(), proc->id());

  PipeCollector out_reader(stdout_pipe, outcome.stdout_output);
  PipeCollector err_reader(stderr_pipe, outcome.stderr_output);
  out_reader.start();
  err_reader.start();

  bool exited = false;
  proc->async_wait([&](const boost::system::error_code &ec, int exit_code) {
    if (!ec) {
      outcome.exit_code = exit_code;
      exited = true;
    }
  });

  if (timeout.count() > 0) {
    io.run_for(timeout);
  } else {
    io.run();
  }

  if (!exited) {
    outcome.timed_out = true;
    boost::system::error_code ignored;
    proc->terminate(ignored);
    stdout_pipe.close(ignored);
    stderr_pipe.close(ignored);
  }
  return outcome;
}

auto command_preview(std::string_view command) -> std::string {
  if (command.size() <= kCommandPreview) {
    return std::string(command);
  }
  return std::format("{}...", command.substr(0, kCommandPreview));
}

} // namespace dagweave
