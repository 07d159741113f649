#pragma once
#include <warden/schema/collaborator_error.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

namespace warden::run {

struct retry_policy final {
  /// Total attempts including the first call.
  uint32_t attempts{3};
  std::chrono::milliseconds backoff{250};
  std::chrono::milliseconds max_backoff{4000};
};

using retry_policy_t = retry_policy;
using sleeper_t = std::function<void(std::chrono::milliseconds)>;

/// Sleeps on the calling thread.
sleeper_t make_thread_sleeper();

/// Delay before retry number `retry` (1-based): backoff * 2^(retry-1),
/// capped at max_backoff.
std::chrono::milliseconds backoff_delay(const retry_policy_t& policy,
                                        uint32_t retry);

/// Call `call` until it succeeds, fails with a non-transient error or the
/// attempts run out. Returns the last outcome.
template <typename T, typename Call>
warden::schema::outcome_t<T> call_with_retry(const retry_policy_t& policy,
                                             const sleeper_t& sleep,
                                             const std::string_view what,
                                             Call&& call) {
  auto attempts = policy.attempts == 0 ? uint32_t{1} : policy.attempts;
  auto outcome = warden::schema::outcome_t<T>{call()};
  for (auto attempt = uint32_t{1}; attempt < attempts; ++attempt) {
    const auto* error =
        std::get_if<warden::schema::collaborator_error_t>(&outcome);
    if (error == nullptr ||
        error->kind != warden::schema::error_kind_t::transient) {
      return outcome;
    }
    auto delay = backoff_delay(policy, attempt);
    spdlog::warn("{} failed ({}), retry {}/{} in {}ms", what, error->reason,
                 attempt, attempts - 1, delay.count());
    sleep(delay);
    outcome = call();
  }
  return outcome;
}

}  // namespace warden::run
