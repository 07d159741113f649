#pragma once
#include <warden/run/coordinator.hpp>
#include <warden/shutdown/participant.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace warden::run {

/// Runs every configured source key once per interval until quiesced.
class scheduler final : public warden::shutdown::participant {
 public:
  scheduler(run_coordinator& coordinator,
            std::vector<std::string> source_keys,
            std::chrono::milliseconds interval);

  /// One run per source key. A key whose run fails fatally is logged and
  /// skipped; the remaining keys still run.
  std::vector<warden::schema::run_summary_t> run_pass();

  /// Passes until quiesced, or a single pass when `once`. Returns the number
  /// of passes made.
  uint32_t run(bool once);

  warden::common::status quiesce() override;
  warden::common::status persist() override;
  warden::common::status release() override;
  bool await_idle(std::chrono::milliseconds timeout) override;

 private:
  run_coordinator& coordinator_;
  std::vector<std::string> source_keys_;
  std::chrono::milliseconds interval_;

  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{false};
  bool busy_{false};
};

}  // namespace warden::run
