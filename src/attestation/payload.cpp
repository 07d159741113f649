#include <warden/abi/encode.hpp>
#include <warden/attestation/payload.hpp>
#include <warden/crypto/keccak.hpp>

namespace warden::attestation {

warden::schema::hash32_t decision_digest(
    const warden::schema::decision_t& decision) {
  auto encoded = warden::abi::encode({
      decision.item_id,
      warden::schema::uint256_t{static_cast<uint8_t>(decision.verdict)},
      warden::schema::uint256_t{
          warden::schema::confidence_bps(decision.confidence)},
      decision.rationale,
      decision.strategy_applied,
  });
  return warden::crypto::keccak256(std::span<const uint8_t>{encoded});
}

warden::schema::hash32_t submission_reference_word(
    const std::string_view reference) {
  if (reference.size() == 66) {
    if (auto word = warden::schema::try_make_hash32(reference)) {
      return *word;
    }
  }
  return warden::crypto::keccak256(reference);
}

warden::schema::bytes_t attestation_data(
    const warden::schema::attestation_record_t& record) {
  return warden::abi::encode({
      record.item_id,
      record.source_key,
      warden::schema::uint256_t{static_cast<uint8_t>(record.verdict)},
      record.decision_digest,
      submission_reference_word(record.submission_reference),
  });
}

}  // namespace warden::attestation
