#pragma once

#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <utility>

namespace warden::common {

/// Log, flush and terminate. Reserved for broken invariants and corrupted
/// process state; recoverable faults travel as outcome types or exceptions.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace warden::common
