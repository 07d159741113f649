#pragma once
#include <warden/attestation/signer.hpp>
#include <warden/checkpoint/store.hpp>
#include <warden/collaborators/decision_engine.hpp>
#include <warden/collaborators/execution_surface.hpp>
#include <warden/collaborators/proposal_source.hpp>
#include <warden/ledger/ledger_writer.hpp>
#include <warden/run/run_config.hpp>
#include <warden/schema/run_summary.hpp>
#include <warden/shutdown/participant.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace warden::run {

/// Collaborators a run coordinator works against. All must outlive it.
struct dependencies final {
  warden::checkpoint::checkpoint_store& store;
  warden::collaborators::proposal_source& source;
  warden::collaborators::decision_engine& engine;
  warden::collaborators::execution_surface& execution;
  const warden::attestation::attestation_signer& signer;
  warden::ledger::ledger_writer& ledger;
};

using dependencies_t = dependencies;

/// Orchestrates checkpointed runs over one or more source keys.
///
/// Per item the pipeline is decide, submit, sign, write to the ledger, with
/// the checkpoint saved before every side effect:
///   A  item recorded in flight, before the decision engine is called
///   B  item completed (failed, skipped or simulated) without a submission
///   D  decision recorded, before the execution surface is called
///   S  submission reference recorded, before signing
///   C  item completed as submitted, after the ledger acknowledged
/// A run first reconciles every item left in flight by an earlier run, then
/// processes new feed items in feed order. Only one run per source key may
/// be active; different keys may run concurrently.
class run_coordinator final : public warden::shutdown::participant {
 public:
  using clock_t = std::function<warden::schema::timestamp_milliseconds_t()>;

  run_coordinator(run_config_t config,
                  dependencies_t deps,
                  clock_t clock,
                  sleeper_t sleeper);

  run_coordinator(run_config_t config, dependencies_t deps);

  /// Throws run_in_progress_error when `source_key` is already running and
  /// fatal_run_error when the checkpoint store or the feed is unreachable.
  /// Individual item failures are reported in the summary.
  warden::schema::run_summary_t run(std::string_view source_key);

  const run_config_t& config() const;

  warden::common::status quiesce() override;
  warden::common::status persist() override;
  warden::common::status release() override;
  bool await_idle(std::chrono::milliseconds timeout) override;

  bool quiescing() const;

 private:
  struct run_state;

  void recover(run_state& state);
  warden::schema::report_status_t process_item(
      run_state& state,
      const warden::schema::pending_item_t& item);
  warden::schema::report_status_t submit_and_attest(run_state& state,
                                                    const std::string& item_id);
  warden::schema::report_status_t attest(run_state& state,
                                         const std::string& item_id);
  warden::schema::outcome_t<std::string> submit_with_retry(
      run_state& state,
      const warden::schema::decision_t& decision);
  warden::schema::outcome_t<std::optional<std::string>> lookup_submission(
      run_state& state,
      const std::string& item_id);

  warden::schema::report_status_t complete(
      run_state& state,
      std::string item_id,
      warden::schema::item_outcome_t outcome,
      warden::schema::item_phase_t phase,
      std::string reason,
      std::optional<std::string> submission_reference = std::nullopt,
      std::optional<warden::schema::hash32_t> record_id = std::nullopt);
  void save(run_state& state, std::string_view durability_point);

  warden::schema::timestamp_milliseconds_t now() const;

  run_config_t config_;
  dependencies_t deps_;
  clock_t clock_;
  sleeper_t sleeper_;

  std::atomic<bool> quiescing_{false};
  std::mutex active_mutex_;
  std::condition_variable idle_;
  std::set<std::string> active_keys_;
};

/// Milliseconds since the Unix epoch.
warden::schema::timestamp_milliseconds_t system_clock_milliseconds();

}  // namespace warden::run
