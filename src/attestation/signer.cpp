#include <warden/attestation/payload.hpp>
#include <warden/attestation/signer.hpp>

#include <utility>

namespace warden::attestation {

attestation_signer::attestation_signer(warden::crypto::signing_key key,
                                       signer_config_t config)
    : key_{std::move(key)},
      config_{config},
      domain_{make_proxy_domain(config.chain_id, config.verifying_contract)} {}

const warden::schema::address_t& attestation_signer::address() const {
  return key_.address();
}

const warden::eip712::domain_t& attestation_signer::domain() const {
  return domain_;
}

uint64_t attestation_signer::deadline_from(
    const warden::schema::timestamp_seconds_t now) const {
  return now + config_.ttl_seconds;
}

attest_request_t attestation_signer::build_request(
    const warden::schema::attestation_record_t& record,
    const uint64_t deadline) const {
  return attest_request_t{.attester = key_.address(),
                          .schema = config_.schema,
                          .recipient = config_.recipient,
                          .expiration_time = 0,
                          .revocable = true,
                          .ref_uid = warden::schema::make_zero_hash(),
                          .data = attestation_data(record),
                          .value = 0,
                          .deadline = deadline};
}

signed_attestation_t attestation_signer::sign(
    const warden::schema::attestation_record_t& record,
    const uint64_t deadline) const {
  return sign_request(build_request(record, deadline));
}

signed_attestation_t attestation_signer::sign_request(
    attest_request_t request) const {
  request.attester = key_.address();
  auto digest = attest_digest(domain_, request);
  auto signature = key_.sign_digest(digest);
  return signed_attestation_t{.request = std::move(request),
                              .digest = digest,
                              .signature = signature};
}

}  // namespace warden::attestation
