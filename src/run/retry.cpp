#include <warden/run/retry.hpp>

#include <algorithm>
#include <thread>

namespace warden::run {

sleeper_t make_thread_sleeper() {
  return [](const std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
  };
}

std::chrono::milliseconds backoff_delay(const retry_policy_t& policy,
                                        const uint32_t retry) {
  auto delay = policy.backoff;
  for (auto i = uint32_t{1}; i < retry && delay < policy.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_backoff);
}

}  // namespace warden::run
