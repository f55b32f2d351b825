#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace swapguard::common {

/// Log an unrecoverable fault, flush all sinks, and terminate the process.
///
/// Reserved for storage and codec faults. Domain failures (denied
/// transfers, slippage, expiry) are reported through result codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace swapguard::common
