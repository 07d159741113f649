#pragma once
#include <warden/ledger/attestation_ledger.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>

namespace warden::ledger {

/// Ledger entry as stored by the proxy.
struct stored_attestation final {
  warden::schema::hash32_t record_id{};
  warden::attestation::attest_request_t request;
  uint64_t time{};
};

using stored_attestation_t = stored_attestation;

/// In-process model of the EIP-712 attestation proxy.
///
/// Recomputes the canonical Attest digest from the request, recovers the
/// signer and requires it to equal `attester`. Deadlines are compared with
/// the block time supplied by `clock`. Thread safe.
class eip712_proxy final : public attestation_ledger {
 public:
  using clock_t = std::function<uint64_t()>;

  eip712_proxy(warden::schema::address_t address,
               uint64_t chain_id,
               clock_t clock);

  void register_schema(const warden::schema::hash32_t& schema);

  warden::schema::address_t address() const override;

  warden::schema::hash32_t attest_by_delegation(
      const warden::attestation::attest_request_t& request,
      const warden::schema::signature_t& signature) override;

  std::optional<stored_attestation_t> find(
      const warden::schema::hash32_t& record_id) const;

  size_t size() const;

 private:
  warden::schema::address_t address_;
  warden::eip712::domain_t domain_;
  clock_t clock_;
  mutable std::mutex mutex_;
  std::set<warden::schema::hash32_t> schemas_;
  std::map<warden::schema::hash32_t, stored_attestation_t> records_;
  uint64_t nonce_{};
};

}  // namespace warden::ledger
