#pragma once
#include <warden/schema/decision.hpp>
#include <warden/schema/item_outcome.hpp>
#include <warden/schema/pending_item.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace warden::schema {

/// An item that has started the pipeline but not reached a terminal state.
///
/// Fields fill in as the item advances: `decision` once the engine answered
/// and the item was accepted for submission, `submission_reference` once the
/// execution surface acknowledged.
struct in_flight_entry final {
  pending_item_t item;
  item_phase_t phase{item_phase_t::deciding};
  std::optional<decision_t> decision;
  std::optional<std::string> submission_reference;
  uint32_t attestation_attempts{};
};

struct completed_entry final {
  std::string item_id;
  item_outcome_t outcome{item_outcome_t::failed};
  item_phase_t phase{item_phase_t::deciding};
  std::string reason;
  std::optional<std::string> submission_reference;
  std::optional<hash32_t> record_id;
  /// Zero for entries written before completion times were recorded.
  timestamp_milliseconds_t completed_at{};
};

template <uint16_t Version>
struct run_checkpoint;

/// Durable progress of one source key. An id is never in both maps.
///
/// Version 2 added `completed_entry::completed_at`; version 1 checkpoints
/// still load.
template <>
struct run_checkpoint<2> final {
  static constexpr uint16_t version = 2;

  std::string source_key;
  std::map<std::string, in_flight_entry> in_flight;
  std::map<std::string, completed_entry> completed;
  timestamp_milliseconds_t last_run_started_at{};
  timestamp_milliseconds_t last_run_finished_at{};
};

using run_checkpoint_t = run_checkpoint<2>;

std::set<std::string> in_flight_item_ids(const run_checkpoint_t& checkpoint);
std::set<std::string> completed_item_ids(const run_checkpoint_t& checkpoint);

/// True when a run started after the last one that finished.
bool unclean_shutdown(const run_checkpoint_t& checkpoint);

/// True when no id is both in flight and completed.
bool disjoint(const run_checkpoint_t& checkpoint);

}  // namespace warden::schema
