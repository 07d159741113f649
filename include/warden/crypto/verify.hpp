#pragma once

#include <warden/schema/primitives.hpp>

#include <optional>

namespace warden::crypto {

/// Recover the signing address from a 65-byte [r || s || v] signature.
///
/// v may be a raw recovery id (0, 1) or Ethereum style (27, 28). Signatures
/// with s in the upper half of the order are rejected, as the verifying
/// contract rejects them.
std::optional<warden::schema::address_t> recover_address(
    const warden::schema::hash32_t& digest,
    const warden::schema::signature_t& signature);

bool verify_signature(const warden::schema::hash32_t& digest,
                      const warden::schema::address_t& signer,
                      const warden::schema::signature_t& signature);

}  // namespace warden::crypto
