#include <spdlog/spdlog.h>
#include <warden/run/errors.hpp>
#include <warden/run/scheduler.hpp>

#include <utility>

namespace warden::run {

scheduler::scheduler(run_coordinator& coordinator,
                     std::vector<std::string> source_keys,
                     const std::chrono::milliseconds interval)
    : coordinator_{coordinator},
      source_keys_{std::move(source_keys)},
      interval_{interval} {}

std::vector<warden::schema::run_summary_t> scheduler::run_pass() {
  auto summaries = std::vector<warden::schema::run_summary_t>{};
  for (const auto& key : source_keys_) {
    {
      auto lock = std::scoped_lock{mutex_};
      if (stopping_) {
        break;
      }
    }
    try {
      summaries.push_back(coordinator_.run(key));
    } catch (const fatal_run_error& e) {
      spdlog::error("run '{}' aborted: {}", key, e.what());
    } catch (const run_in_progress_error& e) {
      spdlog::warn("{}", e.what());
    }
  }
  return summaries;
}

uint32_t scheduler::run(const bool once) {
  auto passes = uint32_t{0};
  while (true) {
    {
      auto lock = std::scoped_lock{mutex_};
      if (stopping_) {
        break;
      }
      busy_ = true;
    }
    run_pass();
    ++passes;
    {
      auto lock = std::unique_lock{mutex_};
      busy_ = false;
      wake_.notify_all();
      if (once) {
        break;
      }
      spdlog::debug("next pass in {}s",
                    std::chrono::duration_cast<std::chrono::seconds>(interval_)
                        .count());
      if (wake_.wait_for(lock, interval_, [&] { return stopping_; })) {
        break;
      }
    }
  }
  spdlog::info("scheduler stopped after {} passes", passes);
  return passes;
}

warden::common::status scheduler::quiesce() {
  {
    auto lock = std::scoped_lock{mutex_};
    stopping_ = true;
  }
  wake_.notify_all();
  return warden::common::status::success();
}

warden::common::status scheduler::persist() {
  return warden::common::status::success();
}

warden::common::status scheduler::release() {
  return warden::common::status::success();
}

bool scheduler::await_idle(const std::chrono::milliseconds timeout) {
  auto lock = std::unique_lock{mutex_};
  return wake_.wait_for(lock, timeout, [&] { return !busy_; });
}

}  // namespace warden::run
