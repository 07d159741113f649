#pragma once
#include <warden/attestation/attest_request.hpp>
#include <warden/crypto/signing_key.hpp>
#include <warden/schema/attestation_record.hpp>

#include <cstdint>

namespace warden::attestation {

struct signer_config final {
  uint64_t chain_id{};
  warden::schema::address_t verifying_contract{};
  warden::schema::hash32_t schema{};
  warden::schema::address_t recipient{};
  uint64_t ttl_seconds{3600};
};

using signer_config_t = signer_config;

/// Builds and signs delegated `Attest` messages for one signing key.
///
/// The attester member is always the key's own address. Signing is
/// deterministic: the same record and deadline give the same bytes. The key is
/// only read, so one signer can be shared across runs for different sources.
class attestation_signer final {
 public:
  attestation_signer(warden::crypto::signing_key key, signer_config_t config);

  const warden::schema::address_t& address() const;
  const warden::eip712::domain_t& domain() const;

  /// `now + ttl`.
  uint64_t deadline_from(warden::schema::timestamp_seconds_t now) const;

  attest_request_t build_request(
      const warden::schema::attestation_record_t& record,
      uint64_t deadline) const;

  signed_attestation_t sign(const warden::schema::attestation_record_t& record,
                            uint64_t deadline) const;

  /// Signs `request` as given, after forcing `attester` to this key.
  signed_attestation_t sign_request(attest_request_t request) const;

 private:
  warden::crypto::signing_key key_;
  signer_config_t config_;
  warden::eip712::domain_t domain_;
};

}  // namespace warden::attestation
