#include <spdlog/spdlog.h>
#include <warden/crypto/keccak.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/ledger/eip712_proxy.hpp>
#include <warden/ledger/revert_error.hpp>
#include <warden/schema/key/builder.hpp>

#include <utility>

namespace warden::ledger {

namespace {

// keccak256 over the packed request and the proxy nonce.
warden::schema::hash32_t make_record_id(
    const warden::attestation::attest_request_t& request,
    const uint64_t time,
    const uint64_t nonce) {
  auto packed = warden::schema::key::builder{};
  packed.write(std::span<const uint8_t>{request.schema})
      .write(std::span<const uint8_t>{request.recipient})
      .write(std::span<const uint8_t>{request.attester})
      .write_ordered(time)
      .write_ordered(request.expiration_time)
      .write(std::span<const uint8_t>{request.ref_uid})
      .write(std::span<const uint8_t>{request.data})
      .write_ordered(nonce);
  packed.data.push_back(request.revocable ? 1 : 0);
  return warden::crypto::keccak256(std::span<const uint8_t>{packed.data});
}

}  // namespace

eip712_proxy::eip712_proxy(warden::schema::address_t address,
                           const uint64_t chain_id,
                           clock_t clock)
    : address_{address},
      domain_{warden::attestation::make_proxy_domain(chain_id, address)},
      clock_{std::move(clock)} {}

void eip712_proxy::register_schema(const warden::schema::hash32_t& schema) {
  auto lock = std::scoped_lock{mutex_};
  schemas_.insert(schema);
}

warden::schema::address_t eip712_proxy::address() const {
  return address_;
}

warden::schema::hash32_t eip712_proxy::attest_by_delegation(
    const warden::attestation::attest_request_t& request,
    const warden::schema::signature_t& signature) {
  auto now = clock_();
  if (request.deadline != 0 && request.deadline < now) {
    throw revert_error{kDeadlineExpired};
  }
  auto digest = warden::attestation::attest_digest(domain_, request);
  if (!warden::crypto::verify_signature(digest, request.attester, signature)) {
    throw revert_error{kInvalidSignature};
  }

  auto lock = std::scoped_lock{mutex_};
  if (!schemas_.contains(request.schema)) {
    throw revert_error{kInvalidSchema};
  }
  auto record_id = make_record_id(request, now, nonce_);
  ++nonce_;
  records_.emplace(record_id, stored_attestation_t{.record_id = record_id,
                                                   .request = request,
                                                   .time = now});
  spdlog::debug("proxy recorded attestation {}",
                warden::schema::to_hex(record_id));
  return record_id;
}

std::optional<stored_attestation_t> eip712_proxy::find(
    const warden::schema::hash32_t& record_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = records_.find(record_id);
  if (it == std::end(records_)) {
    return std::nullopt;
  }
  return it->second;
}

size_t eip712_proxy::size() const {
  auto lock = std::scoped_lock{mutex_};
  return records_.size();
}

}  // namespace warden::ledger
