#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace orca::common {

/// Log the message, flush every logger and terminate the process.
///
/// Reserved for broken internal invariants and unrecoverable I/O failures.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace orca::common
