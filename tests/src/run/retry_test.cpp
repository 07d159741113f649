#include <gtest/gtest.h>
#include <warden/run/retry.hpp>

#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;

struct recorded_sleeps final {
  std::vector<std::chrono::milliseconds> delays;

  warden::run::sleeper_t sleeper() {
    return [this](const std::chrono::milliseconds delay) {
      delays.push_back(delay);
    };
  }
};

}  // namespace

TEST(retry, backoff_doubles_up_to_the_cap) {
  auto policy = warden::run::retry_policy_t{
      .attempts = 10, .backoff = 250ms, .max_backoff = 1500ms};
  EXPECT_EQ(warden::run::backoff_delay(policy, 1), 250ms);
  EXPECT_EQ(warden::run::backoff_delay(policy, 2), 500ms);
  EXPECT_EQ(warden::run::backoff_delay(policy, 3), 1000ms);
  EXPECT_EQ(warden::run::backoff_delay(policy, 4), 1500ms);
  EXPECT_EQ(warden::run::backoff_delay(policy, 40), 1500ms);
}

TEST(retry, retries_transient_errors_until_success) {
  auto sleeps = recorded_sleeps{};
  auto calls = 0;
  auto outcome = warden::run::call_with_retry<std::string>(
      warden::run::retry_policy_t{}, sleeps.sleeper(), "fetch",
      [&]() -> warden::schema::outcome_t<std::string> {
        if (++calls < 3) {
          return warden::schema::transient_error("timeout");
        }
        return std::string{"done"};
      });
  ASSERT_TRUE(warden::schema::succeeded(outcome));
  EXPECT_EQ(std::get<std::string>(outcome), "done");
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(sleeps.delays, (std::vector<std::chrono::milliseconds>{250ms,
                                                                    500ms}));
}

TEST(retry, gives_up_after_the_configured_attempts) {
  auto sleeps = recorded_sleeps{};
  auto calls = 0;
  auto outcome = warden::run::call_with_retry<int>(
      warden::run::retry_policy_t{.attempts = 4}, sleeps.sleeper(), "fetch",
      [&]() -> warden::schema::outcome_t<int> {
        ++calls;
        return warden::schema::transient_error("still down");
      });
  ASSERT_FALSE(warden::schema::succeeded(outcome));
  EXPECT_EQ(std::get<warden::schema::collaborator_error_t>(outcome).reason,
            "still down");
  EXPECT_EQ(calls, 4);
  EXPECT_EQ(sleeps.delays.size(), 3u);
}

TEST(retry, permanent_errors_are_not_retried) {
  auto sleeps = recorded_sleeps{};
  auto calls = 0;
  auto outcome = warden::run::call_with_retry<int>(
      warden::run::retry_policy_t{}, sleeps.sleeper(), "fetch",
      [&]() -> warden::schema::outcome_t<int> {
        ++calls;
        return warden::schema::permanent_error("gone");
      });
  EXPECT_FALSE(warden::schema::succeeded(outcome));
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeps.delays.empty());
}
