#pragma once
#include <warden/attestation/attest_request.hpp>
#include <warden/schema/primitives.hpp>

namespace warden::ledger {

/// The append-only ledger that verifies and stores delegated attestations.
class attestation_ledger {
 public:
  virtual ~attestation_ledger() = default;

  /// Address the ledger is deployed at.
  virtual warden::schema::address_t address() const = 0;

  /// Verify `signature` over `request` and append it. Returns the new record
  /// id; throws revert_error with the rejection reason and leaves no trace.
  virtual warden::schema::hash32_t attest_by_delegation(
      const warden::attestation::attest_request_t& request,
      const warden::schema::signature_t& signature) = 0;
};

}  // namespace warden::ledger
