#pragma once
#include <warden/attestation/attest_request.hpp>
#include <warden/ledger/ledger_counter.hpp>
#include <warden/schema/collaborator_error.hpp>

namespace warden::ledger {

/// Where the run coordinator sends signed attestations.
class ledger_writer {
 public:
  virtual ~ledger_writer() = default;

  /// Record id on success. Ledger reverts come back as `rejected` errors
  /// carrying the revert reason.
  virtual warden::schema::outcome_t<warden::schema::hash32_t> write(
      const warden::attestation::signed_attestation_t& attestation) = 0;
};

/// Forwards through a ledger_counter as a fixed submitter address.
class counter_writer final : public ledger_writer {
 public:
  counter_writer(ledger_counter& counter,
                 warden::schema::address_t submitter,
                 bool require_active_signer);

  warden::schema::outcome_t<warden::schema::hash32_t> write(
      const warden::attestation::signed_attestation_t& attestation) override;

 private:
  ledger_counter& counter_;
  warden::schema::address_t submitter_;
  bool require_active_signer_;
};

}  // namespace warden::ledger
