#include <warden/schema/encoding/scale/run_checkpoint.hpp>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

namespace {

template <typename Enum>
std::optional<Enum> to_enum(const uint8_t raw, const Enum last) {
  if (raw > static_cast<uint8_t>(last)) {
    return std::nullopt;
  }
  return static_cast<Enum>(raw);
}

decision_row_t to_row(const decision_t& o) {
  return decision_row_t{o.item_id, static_cast<uint8_t>(o.verdict),
                        confidence_bps(o.confidence), o.rationale,
                        o.strategy_applied};
}

std::optional<decision_t> from_row(const decision_row_t& row) {
  auto verdict = to_enum(std::get<1>(row), verdict_t::abstain);
  if (!verdict) {
    return std::nullopt;
  }
  return decision_t{.item_id = std::get<0>(row),
                    .verdict = *verdict,
                    .confidence = confidence_from_bps(std::get<2>(row)),
                    .rationale = std::get<3>(row),
                    .strategy_applied = std::get<4>(row)};
}

}  // namespace

run_checkpoint_row_t to_row(const run_checkpoint<2>& checkpoint) {
  auto in_flight = std::vector<in_flight_row_t>{};
  in_flight.reserve(checkpoint.in_flight.size());
  for (const auto& [id, o] : checkpoint.in_flight) {
    auto decision = std::optional<decision_row_t>{};
    if (o.decision) {
      decision = to_row(*o.decision);
    }
    in_flight.emplace_back(o.item.item_id, o.item.origin, o.item.payload,
                           static_cast<uint8_t>(o.phase), decision,
                           o.submission_reference, o.attestation_attempts);
  }

  auto completed = std::vector<completed_row_t>{};
  completed.reserve(checkpoint.completed.size());
  for (const auto& [id, o] : checkpoint.completed) {
    completed.emplace_back(o.item_id, static_cast<uint8_t>(o.outcome),
                           static_cast<uint8_t>(o.phase), o.reason,
                           o.submission_reference, o.record_id,
                           o.completed_at);
  }

  return run_checkpoint_row_t{checkpoint.source_key, std::move(in_flight),
                              std::move(completed),
                              checkpoint.last_run_started_at,
                              checkpoint.last_run_finished_at};
}

std::optional<run_checkpoint<2>> from_row(const run_checkpoint_row_t& row) {
  auto checkpoint = run_checkpoint<2>{};
  checkpoint.source_key = std::get<0>(row);
  checkpoint.last_run_started_at = std::get<3>(row);
  checkpoint.last_run_finished_at = std::get<4>(row);

  for (const auto& r : std::get<1>(row)) {
    auto phase = to_enum(std::get<3>(r), item_phase_t::checkpoint);
    if (!phase) {
      return std::nullopt;
    }
    auto entry = in_flight_entry{};
    entry.item = pending_item_t{.item_id = std::get<0>(r),
                                .origin = std::get<1>(r),
                                .payload = std::get<2>(r)};
    entry.phase = *phase;
    if (std::get<4>(r)) {
      entry.decision = from_row(*std::get<4>(r));
      if (!entry.decision) {
        return std::nullopt;
      }
    }
    entry.submission_reference = std::get<5>(r);
    entry.attestation_attempts = std::get<6>(r);
    checkpoint.in_flight.emplace(entry.item.item_id, std::move(entry));
  }

  for (const auto& r : std::get<2>(row)) {
    auto outcome = to_enum(std::get<1>(r), item_outcome_t::failed);
    auto phase = to_enum(std::get<2>(r), item_phase_t::checkpoint);
    if (!outcome || !phase) {
      return std::nullopt;
    }
    auto entry = completed_entry{.item_id = std::get<0>(r),
                                 .outcome = *outcome,
                                 .phase = *phase,
                                 .reason = std::get<3>(r),
                                 .submission_reference = std::get<4>(r),
                                 .record_id = std::get<5>(r),
                                 .completed_at = std::get<6>(r)};
    checkpoint.completed.emplace(entry.item_id, std::move(entry));
  }

  return checkpoint;
}

std::optional<run_checkpoint<2>> from_row(const run_checkpoint_row_v1_t& row) {
  auto completed = std::vector<completed_row_t>{};
  completed.reserve(std::get<2>(row).size());
  for (const auto& r : std::get<2>(row)) {
    completed.emplace_back(std::get<0>(r), std::get<1>(r), std::get<2>(r),
                           std::get<3>(r), std::get<4>(r), std::get<5>(r),
                           uint64_t{0});
  }
  return from_row(run_checkpoint_row_t{std::get<0>(row), std::get<1>(row),
                                       std::move(completed), std::get<3>(row),
                                       std::get<4>(row)});
}

}  // namespace warden::schema::encoding::scale
