#pragma once

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <warden/schema/primitives.hpp>

#include <memory>
#include <optional>

namespace warden::crypto::detail {

using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

inline bignum_ptr make_bignum() {
  return bignum_ptr{BN_new(), BN_clear_free};
}

inline bignum_ptr make_bignum(const std::span<const uint8_t>& bytes) {
  return bignum_ptr{
      BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr),
      BN_clear_free};
}

inline bn_ctx_ptr make_bn_ctx() {
  return bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
}

inline ec_group_ptr make_secp256k1_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

inline ec_point_ptr make_point(const EC_GROUP* group) {
  return ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
}

inline std::optional<warden::schema::hash32_t> to_hash32(const BIGNUM* value) {
  auto out = warden::schema::hash32_t{};
  if (BN_bn2binpad(value, out.data(), static_cast<int>(out.size())) !=
      static_cast<int>(out.size())) {
    return std::nullopt;
  }
  return out;
}

/// keccak256(X || Y)[12:] of an affine public point.
std::optional<warden::schema::address_t> address_from_point(
    const EC_GROUP* group,
    const EC_POINT* point,
    BN_CTX* ctx);

}  // namespace warden::crypto::detail
