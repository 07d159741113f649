#pragma once
#include <warden/schema/primitives.hpp>
#include <warden/schema/verdict.hpp>

#include <string>

namespace warden::schema {

/// Proof of a completed decision. Built after the execution surface
/// acknowledged, signed once per attempt and written once to the ledger.
struct attestation_record final {
  address_t signer_address{};
  std::string item_id;
  std::string source_key;
  verdict_t verdict{verdict_t::no_action};
  hash32_t decision_digest{};
  std::string submission_reference;
  timestamp_seconds_t created_at{};
};

using attestation_record_t = attestation_record;

}  // namespace warden::schema
