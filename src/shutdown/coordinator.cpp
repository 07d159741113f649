#include <spdlog/spdlog.h>
#include <warden/shutdown/coordinator.hpp>

#include <algorithm>
#include <exception>
#include <utility>

namespace warden::shutdown {

namespace {

template <typename Step>
step_result_t run_step(const std::string& name,
                       const std::string& step,
                       Step&& call) {
  auto result = step_result_t{.participant = name, .step = step};
  try {
    auto status = call();
    result.ok = status.ok;
    result.message = status.message;
  } catch (const std::exception& e) {
    result.ok = false;
    result.message = e.what();
  }
  if (result.ok) {
    spdlog::info("shutdown: {} {} ok", name, step);
  } else {
    spdlog::error("shutdown: {} {} failed: {}", name, step, result.message);
  }
  return result;
}

}  // namespace

coordinator::coordinator(const std::chrono::milliseconds grace_period)
    : grace_period_{grace_period} {}

void coordinator::register_participant(std::string name, participant& p) {
  auto lock = std::scoped_lock{mutex_};
  participants_.push_back(registration{.name = std::move(name), .target = &p});
}

shutdown_report_t coordinator::shutdown() {
  auto lock = std::scoped_lock{mutex_};
  if (report_) {
    return *report_;
  }
  auto report = shutdown_report_t{};
  spdlog::info("shutdown: stopping {} participants", participants_.size());

  for (const auto& r : participants_) {
    report.steps.push_back(
        run_step(r.name, "quiesce", [&] { return r.target->quiesce(); }));
  }

  const auto deadline = std::chrono::steady_clock::now() + grace_period_;
  for (const auto& r : participants_) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    remaining = std::max(remaining, std::chrono::milliseconds{0});
    auto idle = false;
    try {
      idle = r.target->await_idle(remaining);
    } catch (const std::exception& e) {
      spdlog::error("shutdown: {} failed while draining: {}", r.name,
                    e.what());
    }
    if (!idle) {
      report.timed_out = true;
      spdlog::warn("shutdown: {} not idle within the grace period; recovery "
                   "will reconcile on next start",
                   r.name);
    }
  }

  for (const auto& r : participants_) {
    report.steps.push_back(
        run_step(r.name, "persist", [&] { return r.target->persist(); }));
  }

  for (auto it = std::rbegin(participants_); it != std::rend(participants_);
       ++it) {
    const auto& r = *it;
    report.steps.push_back(
        run_step(r.name, "release", [&] { return r.target->release(); }));
  }

  spdlog::info("shutdown: complete{}",
               report.timed_out ? " (grace period exceeded)" : "");
  report_ = report;
  return report;
}

bool coordinator::stopped() const {
  auto lock = std::scoped_lock{mutex_};
  return report_.has_value();
}

}  // namespace warden::shutdown
