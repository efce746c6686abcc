#include "dagweave/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace dagweave {

auto generate_run_id() -> RunId {
  thread_local std::mt19937 rng{std::random_device{}()};
  const auto now = std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  const auto suffix = static_cast<std::uint32_t>(rng());
  return RunId{std::format("{:%Y%m%dT%H%M%S}-{:08x}", now, suffix)};
}

} // namespace dagweave
