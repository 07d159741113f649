#include <warden/attestation/attest_request.hpp>
#include <warden/common/critical.hpp>

namespace warden::attestation {

const warden::eip712::type_definitions_t& attest_types() {
  static const auto types = warden::eip712::type_definitions_t{
      {kAttestTypeName,
       {{.name = "attester", .type = "address"},
        {.name = "schema", .type = "bytes32"},
        {.name = "recipient", .type = "address"},
        {.name = "expirationTime", .type = "uint64"},
        {.name = "revocable", .type = "bool"},
        {.name = "refUID", .type = "bytes32"},
        {.name = "data", .type = "bytes"},
        {.name = "value", .type = "uint256"},
        {.name = "deadline", .type = "uint64"}}}};
  return types;
}

warden::eip712::struct_value_t to_struct_value(
    const attest_request_t& request) {
  using warden::eip712::value_t;
  return warden::eip712::struct_value_t{
      value_t{request.attester},
      value_t{request.schema},
      value_t{request.recipient},
      value_t{warden::schema::uint256_t{request.expiration_time}},
      value_t{request.revocable},
      value_t{request.ref_uid},
      value_t{request.data},
      value_t{request.value},
      value_t{warden::schema::uint256_t{request.deadline}}};
}

warden::schema::hash32_t attest_struct_hash(const attest_request_t& request) {
  auto hashed = warden::eip712::hash_struct(attest_types(), kAttestTypeName,
                                            to_struct_value(request));
  if (!hashed) {
    warden::common::critical("canonical Attest struct failed to encode");
  }
  return *hashed;
}

warden::schema::hash32_t attest_digest(const warden::eip712::domain_t& domain,
                                       const attest_request_t& request) {
  return warden::eip712::digest(warden::eip712::domain_separator(domain),
                                attest_struct_hash(request));
}

warden::eip712::domain_t make_proxy_domain(
    const uint64_t chain_id,
    const warden::schema::address_t& verifying_contract) {
  return warden::eip712::domain_t{.name = kProxyName,
                                  .version = kProxyVersion,
                                  .chain_id = chain_id,
                                  .verifying_contract = verifying_contract};
}

}  // namespace warden::attestation
