#include <warden/shutdown/signals.hpp>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <thread>

namespace warden::shutdown {

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

}  // namespace

void install_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
}

bool termination_requested() {
  return shutdown_requested();
}

void request_termination() {
  shutdown_requested() = true;
}

void clear_termination_request() {
  shutdown_requested() = false;
}

bool wait_for_termination(const std::chrono::milliseconds timeout) {
  constexpr auto kPollInterval = std::chrono::milliseconds{100};
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!termination_requested()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(kPollInterval,
                                                      deadline - now));
  }
  return true;
}

}  // namespace warden::shutdown
