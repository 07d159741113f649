#include <spdlog/spdlog.h>
#include <warden/attestation/payload.hpp>
#include <warden/run/coordinator.hpp>
#include <warden/run/errors.hpp>

#include <chrono>
#include <utility>

namespace warden::run {

namespace {

using warden::schema::item_outcome_t;
using warden::schema::item_phase_t;
using warden::schema::report_status_t;

// Holds the per-key slot for the duration of one run.
class active_run final {
 public:
  active_run(std::mutex& mutex,
             std::condition_variable& idle,
             std::set<std::string>& keys,
             std::string key)
      : mutex_{mutex}, idle_{idle}, keys_{keys}, key_{std::move(key)} {
    auto lock = std::scoped_lock{mutex_};
    if (!keys_.insert(key_).second) {
      throw run_in_progress_error{key_};
    }
  }

  active_run(const active_run&) = delete;
  active_run& operator=(const active_run&) = delete;

  ~active_run() {
    {
      auto lock = std::scoped_lock{mutex_};
      keys_.erase(key_);
    }
    idle_.notify_all();
  }

 private:
  std::mutex& mutex_;
  std::condition_variable& idle_;
  std::set<std::string>& keys_;
  std::string key_;
};

report_status_t to_report_status(const item_outcome_t outcome) {
  switch (outcome) {
    case item_outcome_t::submitted:
      return report_status_t::submitted;
    case item_outcome_t::skipped:
      return report_status_t::skipped;
    case item_outcome_t::simulated:
      return report_status_t::simulated;
    case item_outcome_t::failed:
      return report_status_t::failed;
  }
  return report_status_t::failed;
}

void report(warden::schema::run_summary_t& summary,
            const std::string& item_id,
            const report_status_t status,
            const item_phase_t phase,
            const std::string& reason) {
  auto entry = warden::schema::item_report{
      .item_id = item_id, .status = status, .phase = phase, .reason = reason};
  switch (status) {
    case report_status_t::submitted:
      ++summary.submitted;
      break;
    case report_status_t::skipped:
      ++summary.skipped;
      break;
    case report_status_t::simulated:
      ++summary.simulated;
      break;
    case report_status_t::failed:
      ++summary.failed;
      summary.errors.push_back(entry);
      break;
    case report_status_t::pending_recovery:
      ++summary.pending_recovery;
      summary.errors.push_back(entry);
      break;
  }
  summary.items.push_back(std::move(entry));
}

std::string format_confidence(const double value) {
  return fmt::format("{:.2f}", value);
}

}  // namespace

struct run_coordinator::run_state final {
  std::string source_key;
  warden::schema::run_checkpoint_t checkpoint;
  warden::schema::run_summary_t summary;
};

warden::schema::timestamp_milliseconds_t system_clock_milliseconds() {
  return static_cast<warden::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

run_coordinator::run_coordinator(run_config_t config,
                                 dependencies_t deps,
                                 clock_t clock,
                                 sleeper_t sleeper)
    : config_{std::move(config)},
      deps_{deps},
      clock_{std::move(clock)},
      sleeper_{std::move(sleeper)} {}

run_coordinator::run_coordinator(run_config_t config, dependencies_t deps)
    : run_coordinator{std::move(config), deps, system_clock_milliseconds,
                      make_thread_sleeper()} {}

const run_config_t& run_coordinator::config() const {
  return config_;
}

bool run_coordinator::quiescing() const {
  return quiescing_;
}

warden::schema::timestamp_milliseconds_t run_coordinator::now() const {
  return clock_();
}

warden::schema::run_summary_t run_coordinator::run(
    const std::string_view source_key) {
  auto state = run_state{};
  state.source_key = std::string{source_key};
  state.summary.source_key = state.source_key;
  if (quiescing_) {
    spdlog::info("run '{}' not started: shutting down", source_key);
    state.summary.interrupted = true;
    return state.summary;
  }

  auto guard =
      active_run{active_mutex_, idle_, active_keys_, state.source_key};
  spdlog::info("run '{}' starting", source_key);

  try {
    state.checkpoint = deps_.store.load(source_key);
  } catch (const warden::checkpoint::store_unavailable_error& e) {
    spdlog::error("run '{}' cannot load its checkpoint: {}", source_key,
                  e.what());
    throw fatal_run_error{item_phase_t::checkpoint, e.what()};
  }

  auto& checkpoint = state.checkpoint;
  state.summary.unclean_shutdown_detected =
      warden::schema::unclean_shutdown(checkpoint) ||
      !checkpoint.in_flight.empty();
  if (state.summary.unclean_shutdown_detected) {
    spdlog::warn("run '{}': previous run did not finish cleanly ({} items in "
                 "flight)",
                 source_key, checkpoint.in_flight.size());
  }
  checkpoint.last_run_started_at = now();
  save(state, "run start");

  recover(state);

  if (quiescing_) {
    state.summary.interrupted = true;
  } else {
    auto feed = call_with_retry<std::vector<warden::schema::pending_item_t>>(
        config_.retry, sleeper_, "list_pending",
        [&] { return deps_.source.list_pending(source_key); });
    if (const auto* error =
            std::get_if<warden::schema::collaborator_error_t>(&feed)) {
      spdlog::error("run '{}': proposal feed unreachable: {}", source_key,
                    error->reason);
      throw fatal_run_error{item_phase_t::feed, error->reason};
    }

    auto& pending = std::get<std::vector<warden::schema::pending_item_t>>(feed);
    auto candidates = std::vector<warden::schema::pending_item_t>{};
    for (auto& item : pending) {
      if (checkpoint.completed.contains(item.item_id) ||
          checkpoint.in_flight.contains(item.item_id)) {
        continue;
      }
      candidates.push_back(std::move(item));
    }

    auto chosen =
        select_items(candidates, config_.origins, config_.max_items_per_run);
    for (const auto& filtered : chosen.filtered) {
      spdlog::info("run '{}': skipping '{}': {}", source_key,
                   filtered.item.item_id, filtered.reason);
      report(state.summary, filtered.item.item_id, report_status_t::skipped,
             item_phase_t::filtering, filtered.reason);
    }
    state.summary.deferred = static_cast<uint32_t>(chosen.deferred.size());
    if (!chosen.deferred.empty()) {
      spdlog::info("run '{}': {} items deferred by the per-run cap of {}",
                   source_key, chosen.deferred.size(),
                   config_.max_items_per_run);
    }

    for (const auto& item : chosen.selected) {
      if (quiescing_) {
        spdlog::info("run '{}': shutdown requested, not starting '{}'",
                     source_key, item.item_id);
        state.summary.interrupted = true;
        break;
      }
      process_item(state, item);
    }
  }

  checkpoint.last_run_finished_at = now();
  save(state, "run finish");

  const auto& summary = state.summary;
  spdlog::info(
      "run '{}' finished: decided {}, submitted {}, skipped {}, simulated {}, "
      "failed {}, recovered {}, pending recovery {}",
      source_key, summary.decided, summary.submitted, summary.skipped,
      summary.simulated, summary.failed, summary.recovered,
      summary.pending_recovery);
  return state.summary;
}

void run_coordinator::recover(run_state& state) {
  auto& checkpoint = state.checkpoint;
  if (checkpoint.in_flight.empty()) {
    return;
  }
  spdlog::warn("run '{}': recovering {} in-flight items", state.source_key,
               checkpoint.in_flight.size());

  for (const auto& id : warden::schema::in_flight_item_ids(checkpoint)) {
    if (quiescing_) {
      state.summary.interrupted = true;
      break;
    }
    if (config_.dry_run) {
      report(state.summary, id, report_status_t::pending_recovery,
             item_phase_t::recovery, "left in flight during a dry run");
      continue;
    }

    const auto entry = checkpoint.in_flight.at(id);
    auto status = report_status_t::pending_recovery;
    if (entry.phase == item_phase_t::attesting && entry.decision &&
        entry.submission_reference) {
      spdlog::info("recovery: re-attesting '{}' (submission {})", id,
                   *entry.submission_reference);
      status = attest(state, id);
    } else {
      auto found = lookup_submission(state, id);
      if (const auto* error =
              std::get_if<warden::schema::collaborator_error_t>(&found)) {
        spdlog::error("recovery: cannot tell whether '{}' was submitted: {}",
                      id, error->reason);
        report(state.summary, id, report_status_t::pending_recovery,
               item_phase_t::recovery,
               "submission state unknown: " + error->reason);
        continue;
      }
      const auto& reference = std::get<std::optional<std::string>>(found);
      if (reference && entry.decision) {
        spdlog::info("recovery: '{}' was already submitted as {}; attesting",
                     id, *reference);
        auto& live = checkpoint.in_flight.at(id);
        live.submission_reference = *reference;
        live.phase = item_phase_t::attesting;
        save(state, "S");
        status = attest(state, id);
      } else if (reference) {
        spdlog::error("recovery: '{}' was submitted as {} but no decision was "
                      "recorded",
                      id, *reference);
        status = complete(state, id, item_outcome_t::failed,
                          item_phase_t::recovery,
                          "submission found without a recorded decision",
                          *reference);
      } else {
        spdlog::info("recovery: no submission found for '{}'; deciding again",
                     id);
        status = process_item(state, entry.item);
      }
    }
    if (status != report_status_t::pending_recovery) {
      ++state.summary.recovered;
    }
  }
}

report_status_t run_coordinator::process_item(
    run_state& state,
    const warden::schema::pending_item_t& item) {
  auto& checkpoint = state.checkpoint;
  checkpoint.in_flight.insert_or_assign(
      item.item_id, warden::schema::in_flight_entry{
                        .item = item, .phase = item_phase_t::deciding});
  save(state, "A");

  auto decided = call_with_retry<warden::schema::decision_t>(
      config_.retry, sleeper_, "decide",
      [&] { return deps_.engine.decide(item); });
  if (const auto* error =
          std::get_if<warden::schema::collaborator_error_t>(&decided)) {
    spdlog::warn("decision engine failed for '{}' ({}): {}", item.item_id,
                 warden::schema::to_string(error->kind), error->reason);
    return complete(state, item.item_id, item_outcome_t::failed,
                    item_phase_t::deciding, error->reason);
  }
  auto decision = std::get<warden::schema::decision_t>(std::move(decided));
  ++state.summary.decided;

  if (decision.item_id != item.item_id) {
    return complete(state, item.item_id, item_outcome_t::failed,
                    item_phase_t::deciding,
                    "decision engine answered for '" + decision.item_id + "'");
  }
  if (!(decision.confidence >= 0.0 && decision.confidence <= 1.0)) {
    spdlog::error("decision engine gave '{}' confidence {} outside [0, 1]",
                  item.item_id, decision.confidence);
    return complete(state, item.item_id, item_outcome_t::failed,
                    item_phase_t::deciding,
                    "confidence " + format_confidence(decision.confidence) +
                        " outside [0, 1]");
  }
  if (!warden::schema::is_actionable(decision.verdict)) {
    return complete(state, item.item_id, item_outcome_t::skipped,
                    item_phase_t::deciding, "verdict is no_action");
  }
  if (decision.confidence < config_.confidence_threshold) {
    return complete(state, item.item_id, item_outcome_t::skipped,
                    item_phase_t::deciding,
                    "confidence " + format_confidence(decision.confidence) +
                        " below threshold " +
                        format_confidence(config_.confidence_threshold));
  }
  if (config_.dry_run) {
    spdlog::info("dry run: would submit '{}' for '{}'",
                 warden::schema::to_string(decision.verdict), item.item_id);
    return complete(state, item.item_id, item_outcome_t::simulated,
                    item_phase_t::deciding,
                    "dry run: " + std::string{warden::schema::to_string(
                                      decision.verdict)});
  }

  auto& entry = checkpoint.in_flight.at(item.item_id);
  entry.decision = std::move(decision);
  entry.phase = item_phase_t::submitting;
  save(state, "D");
  return submit_and_attest(state, item.item_id);
}

report_status_t run_coordinator::submit_and_attest(run_state& state,
                                                   const std::string& item_id) {
  const auto decision = *state.checkpoint.in_flight.at(item_id).decision;
  auto submitted = submit_with_retry(state, decision);
  if (const auto* error =
          std::get_if<warden::schema::collaborator_error_t>(&submitted)) {
    spdlog::error("execution surface refused '{}' ({}): {}", item_id,
                  warden::schema::to_string(error->kind), error->reason);
    return complete(state, item_id, item_outcome_t::failed,
                    item_phase_t::submitting, error->reason);
  }

  auto& entry = state.checkpoint.in_flight.at(item_id);
  entry.submission_reference = std::get<std::string>(std::move(submitted));
  entry.phase = item_phase_t::attesting;
  spdlog::info("'{}' submitted as {}", item_id, *entry.submission_reference);
  save(state, "S");
  return attest(state, item_id);
}

report_status_t run_coordinator::attest(run_state& state,
                                        const std::string& item_id) {
  auto& entry = state.checkpoint.in_flight.at(item_id);
  const auto limit = config_.max_attestation_attempts;
  if (limit != 0 && entry.attestation_attempts >= limit) {
    spdlog::error("'{}': giving up after {} attestation attempts", item_id,
                  entry.attestation_attempts);
    return complete(state, item_id, item_outcome_t::failed,
                    item_phase_t::attesting, "attestation retries exhausted",
                    entry.submission_reference);
  }
  ++entry.attestation_attempts;
  save(state, "attestation attempt");

  const auto created_at = now() / 1000;
  auto record = warden::schema::attestation_record_t{
      .signer_address = deps_.signer.address(),
      .item_id = item_id,
      .source_key = state.source_key,
      .verdict = entry.decision->verdict,
      .decision_digest = warden::attestation::decision_digest(*entry.decision),
      .submission_reference = *entry.submission_reference,
      .created_at = created_at};
  auto signed_attestation =
      deps_.signer.sign(record, deps_.signer.deadline_from(created_at));

  auto written = deps_.ledger.write(signed_attestation);
  if (const auto* error =
          std::get_if<warden::schema::collaborator_error_t>(&written)) {
    spdlog::error("ledger write for '{}' failed ({}): {}", item_id,
                  warden::schema::to_string(error->kind), error->reason);
    if (limit != 0 && entry.attestation_attempts >= limit) {
      return complete(state, item_id, item_outcome_t::failed,
                      item_phase_t::attesting,
                      "attestation retries exhausted: " + error->reason,
                      entry.submission_reference);
    }
    report(state.summary, item_id, report_status_t::pending_recovery,
           item_phase_t::attesting, error->reason);
    return report_status_t::pending_recovery;
  }

  auto record_id = std::get<warden::schema::hash32_t>(written);
  spdlog::info("'{}' attested as {}", item_id,
               warden::schema::to_hex(record_id));
  return complete(state, item_id, item_outcome_t::submitted,
                  item_phase_t::attesting, {}, entry.submission_reference,
                  record_id);
}

warden::schema::outcome_t<std::string> run_coordinator::submit_with_retry(
    run_state& state,
    const warden::schema::decision_t& decision) {
  const auto attempts = std::max(config_.retry.attempts, uint32_t{1});
  auto last_error = warden::schema::collaborator_error_t{};
  for (auto attempt = uint32_t{0}; attempt < attempts; ++attempt) {
    if (attempt > 0) {
      auto delay = backoff_delay(config_.retry, attempt);
      spdlog::warn("submit '{}' failed ({}), retry {}/{} in {}ms",
                   decision.item_id, last_error.reason, attempt, attempts - 1,
                   delay.count());
      sleeper_(delay);
      // The failed attempt may have gone through; never submit twice.
      auto found =
          deps_.execution.find_submission(decision.item_id, state.source_key);
      if (const auto* error =
              std::get_if<warden::schema::collaborator_error_t>(&found)) {
        last_error = *error;
        continue;
      }
      if (const auto& reference =
              std::get<std::optional<std::string>>(found)) {
        spdlog::info("'{}' was submitted by an earlier attempt as {}",
                     decision.item_id, *reference);
        return *reference;
      }
    }
    auto result = deps_.execution.submit(state.source_key, decision);
    const auto* error =
        std::get_if<warden::schema::collaborator_error_t>(&result);
    if (error == nullptr ||
        error->kind != warden::schema::error_kind_t::transient) {
      return result;
    }
    last_error = *error;
  }
  return last_error;
}

warden::schema::outcome_t<std::optional<std::string>>
run_coordinator::lookup_submission(run_state& state,
                                   const std::string& item_id) {
  return call_with_retry<std::optional<std::string>>(
      config_.retry, sleeper_, "find_submission", [&] {
        return deps_.execution.find_submission(item_id, state.source_key);
      });
}

report_status_t run_coordinator::complete(
    run_state& state,
    std::string item_id,
    const item_outcome_t outcome,
    const item_phase_t phase,
    std::string reason,
    std::optional<std::string> submission_reference,
    std::optional<warden::schema::hash32_t> record_id) {
  auto& checkpoint = state.checkpoint;
  checkpoint.in_flight.erase(item_id);
  checkpoint.completed.insert_or_assign(
      item_id, warden::schema::completed_entry{
                   .item_id = item_id,
                   .outcome = outcome,
                   .phase = phase,
                   .reason = reason,
                   .submission_reference = std::move(submission_reference),
                   .record_id = record_id,
                   .completed_at = now()});
  save(state, outcome == item_outcome_t::submitted ? "C" : "B");

  auto status = to_report_status(outcome);
  spdlog::info("'{}' completed as {} ({}){}", item_id,
               warden::schema::to_string(outcome),
               warden::schema::to_string(phase),
               reason.empty() ? "" : ": " + reason);
  report(state.summary, item_id, status, phase, reason);
  return status;
}

void run_coordinator::save(run_state& state,
                           const std::string_view durability_point) {
  try {
    deps_.store.save(state.source_key, state.checkpoint);
  } catch (const warden::checkpoint::store_unavailable_error& e) {
    spdlog::error("run '{}': checkpoint write at {} failed: {}",
                  state.source_key, durability_point, e.what());
    throw fatal_run_error{item_phase_t::checkpoint, e.what()};
  }
  spdlog::debug("run '{}': checkpoint durable at {}", state.source_key,
                durability_point);
}

warden::common::status run_coordinator::quiesce() {
  quiescing_ = true;
  spdlog::info("run coordinator quiescing");
  return warden::common::status::success();
}

warden::common::status run_coordinator::persist() {
  try {
    deps_.store.persist();
  } catch (const warden::checkpoint::store_unavailable_error& e) {
    return warden::common::status::failure(e.what());
  }
  return warden::common::status::success();
}

warden::common::status run_coordinator::release() {
  auto lock = std::scoped_lock{active_mutex_};
  if (!active_keys_.empty()) {
    return warden::common::status::failure(
        std::to_string(active_keys_.size()) + " runs still active");
  }
  return warden::common::status::success();
}

bool run_coordinator::await_idle(const std::chrono::milliseconds timeout) {
  auto lock = std::unique_lock{active_mutex_};
  return idle_.wait_for(lock, timeout, [&] { return active_keys_.empty(); });
}

}  // namespace warden::run
