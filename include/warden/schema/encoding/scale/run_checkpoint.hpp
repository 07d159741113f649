#pragma once
#include <warden/schema/run_checkpoint.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Wire layouts of run checkpoints. Records are flattened to tuples of
// primitives so the codec only ever sees types it encodes natively. A new
// version appends fields to a row and keeps the older row types decodable.
namespace warden::schema::encoding::scale {

// item_id, verdict, confidence_bps, rationale, strategy_applied
using decision_row_t =
    std::tuple<std::string, uint8_t, uint32_t, std::string, std::string>;

// item_id, origin, payload, phase, decision, submission_reference,
// attestation_attempts
using in_flight_row_t = std::tuple<std::string,
                                   std::string,
                                   std::string,
                                   uint8_t,
                                   std::optional<decision_row_t>,
                                   std::optional<std::string>,
                                   uint32_t>;

// item_id, outcome, phase, reason, submission_reference, record_id
using completed_row_v1_t =
    std::tuple<std::string,
               uint8_t,
               uint8_t,
               std::string,
               std::optional<std::string>,
               std::optional<warden::schema::hash32_t>>;

// completed_row_v1_t followed by completed_at
using completed_row_t = std::tuple<std::string,
                                   uint8_t,
                                   uint8_t,
                                   std::string,
                                   std::optional<std::string>,
                                   std::optional<warden::schema::hash32_t>,
                                   uint64_t>;

// source_key, in_flight, completed, last_run_started_at, last_run_finished_at
template <typename CompletedRow>
using checkpoint_row_t = std::tuple<std::string,
                                    std::vector<in_flight_row_t>,
                                    std::vector<CompletedRow>,
                                    uint64_t,
                                    uint64_t>;

using run_checkpoint_row_v1_t = checkpoint_row_t<completed_row_v1_t>;
using run_checkpoint_row_t = checkpoint_row_t<completed_row_t>;

run_checkpoint_row_t to_row(const run_checkpoint<2>& checkpoint);

/// Rejects rows carrying enum values this build does not know.
std::optional<run_checkpoint<2>> from_row(const run_checkpoint_row_t& row);

/// Upgrades a version 1 row; completion times stay zero.
std::optional<run_checkpoint<2>> from_row(const run_checkpoint_row_v1_t& row);

}  // namespace warden::schema::encoding::scale
