#pragma once
#include <warden/eip712/typed_data.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>

namespace warden::attestation {

/// Body of the delegated `Attest` message accepted by the verifying proxy.
/// Member order matches the signed type exactly, attester first.
struct attest_request final {
  warden::schema::address_t attester{};
  warden::schema::hash32_t schema{};
  warden::schema::address_t recipient{};
  uint64_t expiration_time{};
  bool revocable{true};
  warden::schema::hash32_t ref_uid{};
  warden::schema::bytes_t data;
  warden::schema::uint256_t value{};
  uint64_t deadline{};
};

using attest_request_t = attest_request;

struct signed_attestation final {
  attest_request_t request;
  warden::schema::hash32_t digest{};
  warden::schema::signature_t signature{};
};

using signed_attestation_t = signed_attestation;

inline constexpr auto kAttestTypeName = "Attest";
inline constexpr auto kProxyName = "EIP712Proxy";
inline constexpr auto kProxyVersion = "1.2.0";

/// The canonical `Attest` type as the verifying proxy defines it.
const warden::eip712::type_definitions_t& attest_types();

warden::eip712::struct_value_t to_struct_value(const attest_request_t& request);

warden::schema::hash32_t attest_struct_hash(const attest_request_t& request);

/// Final EIP-712 digest of `request` under `domain`.
warden::schema::hash32_t attest_digest(
    const warden::eip712::domain_t& domain,
    const attest_request_t& request);

/// Proxy domain for the given chain and verifying contract.
warden::eip712::domain_t make_proxy_domain(
    uint64_t chain_id,
    const warden::schema::address_t& verifying_contract);

}  // namespace warden::attestation
