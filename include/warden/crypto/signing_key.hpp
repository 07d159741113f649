#pragma once
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace warden::crypto {

/// secp256k1 private key with its derived Ethereum address.
///
/// Signing is deterministic: nonces come from RFC 6979 (HMAC-SHA256), `s` is
/// normalised to the lower half of the curve order and the result is laid out
/// as [r || s || v] with v = 27 + recovery id. Identical digests therefore
/// always produce byte-identical signatures.
class signing_key final {
 public:
  /// Rejects zero and values not below the curve order.
  static std::optional<signing_key> from_secret(
      const warden::schema::hash32_t& secret);
  static std::optional<signing_key> from_hex(std::string_view hex);

  signing_key(const signing_key&) = default;
  signing_key& operator=(const signing_key&) = default;
  ~signing_key();

  const warden::schema::address_t& address() const { return address_; }

  /// Sign a 32-byte prehashed digest. Never fails for a valid key.
  warden::schema::signature_t sign_digest(
      const warden::schema::hash32_t& digest) const;

 private:
  signing_key(const warden::schema::hash32_t& secret,
              const warden::schema::address_t& address);

  warden::schema::hash32_t secret_;
  warden::schema::address_t address_;
};

}  // namespace warden::crypto
