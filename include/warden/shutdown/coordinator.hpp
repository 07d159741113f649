#pragma once
#include <warden/shutdown/participant.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::shutdown {

struct step_result final {
  std::string participant;
  std::string step;
  bool ok{true};
  std::string message;
};

using step_result_t = step_result;

struct shutdown_report final {
  std::vector<step_result_t> steps;
  /// The grace period ran out before every participant was idle.
  bool timed_out{false};
};

using shutdown_report_t = shutdown_report;

/// Drives the ordered stop sequence over registered participants.
///
/// `shutdown()` calls quiesce on every participant in registration order,
/// waits up to the grace period for them to go idle, calls persist in
/// registration order and release in reverse order. A failing or throwing
/// participant is logged and the sequence moves on. The sequence runs once.
class coordinator final {
 public:
  explicit coordinator(std::chrono::milliseconds grace_period);

  /// Participants must outlive the coordinator.
  void register_participant(std::string name, participant& p);

  shutdown_report_t shutdown();

  bool stopped() const;

 private:
  struct registration final {
    std::string name;
    participant* target{nullptr};
  };

  std::chrono::milliseconds grace_period_;
  mutable std::mutex mutex_;
  std::vector<registration> participants_;
  std::optional<shutdown_report_t> report_;
};

}  // namespace warden::shutdown
