#pragma once
#include <warden/schema/attestation_record.hpp>
#include <warden/schema/decision.hpp>
#include <warden/schema/primitives.hpp>

#include <string_view>

namespace warden::attestation {

/// keccak256(abi.encode(string item_id, uint256 verdict, uint256
/// confidence_bps, string rationale, string strategy_applied)).
warden::schema::hash32_t decision_digest(
    const warden::schema::decision_t& decision);

/// A 32-byte hex reference is used verbatim, anything else is hashed.
warden::schema::hash32_t submission_reference_word(std::string_view reference);

/// abi.encode(string item_id, string source_key, uint256 verdict, bytes32
/// decision_digest, bytes32 submission_reference). The `data` member of the
/// signed Attest message.
warden::schema::bytes_t attestation_data(
    const warden::schema::attestation_record_t& record);

}  // namespace warden::attestation
