#include <openssl/evp.h>
#include <warden/crypto/verify.hpp>

#include "secp256k1_detail.hpp"

namespace warden::crypto {

std::optional<warden::schema::address_t> recover_address(
    const warden::schema::hash32_t& digest,
    const warden::schema::signature_t& signature) {
  auto v = signature[64];
  auto recovery_id = v >= 27 ? static_cast<uint8_t>(v - 27) : v;
  if (recovery_id > 3) {
    return std::nullopt;
  }

  auto group = detail::make_secp256k1_group();
  auto ctx = detail::make_bn_ctx();
  if (!group || !ctx) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());

  auto r = detail::make_bignum(std::span<const uint8_t>{signature.data(), 32});
  auto s =
      detail::make_bignum(std::span<const uint8_t>{signature.data() + 32, 32});
  auto half_order = detail::make_bignum();
  if (!r || !s || !half_order || BN_rshift1(half_order.get(), order) != 1) {
    return std::nullopt;
  }
  if (BN_is_zero(r.get()) || BN_cmp(r.get(), order) >= 0 ||
      BN_is_zero(s.get()) || BN_cmp(s.get(), half_order.get()) > 0) {
    return std::nullopt;
  }

  auto field = detail::make_bignum();
  auto x = detail::make_bignum();
  if (!field || !x ||
      EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr,
                         ctx.get()) != 1 ||
      BN_copy(x.get(), r.get()) == nullptr) {
    return std::nullopt;
  }
  if ((recovery_id & 2) != 0 && BN_add(x.get(), x.get(), order) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(x.get(), field.get()) >= 0) {
    return std::nullopt;
  }

  auto nonce_point = detail::make_point(group.get());
  if (!nonce_point ||
      EC_POINT_set_compressed_coordinates(group.get(), nonce_point.get(),
                                          x.get(), recovery_id & 1,
                                          ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 (s R - z G)
  auto z = detail::make_bignum(digest);
  auto r_inverse = detail::make_bignum();
  auto u1 = detail::make_bignum();
  auto u2 = detail::make_bignum();
  if (!z || !r_inverse || !u1 || !u2) {
    return std::nullopt;
  }
  if (BN_nnmod(z.get(), z.get(), order, ctx.get()) != 1 ||
      BN_mod_inverse(r_inverse.get(), r.get(), order, ctx.get()) == nullptr ||
      BN_mod_sub(u1.get(), order, z.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u1.get(), u1.get(), r_inverse.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto public_point = detail::make_point(group.get());
  if (!public_point ||
      EC_POINT_mul(group.get(), public_point.get(), u1.get(),
                   nonce_point.get(), u2.get(), ctx.get()) != 1 ||
      EC_POINT_is_at_infinity(group.get(), public_point.get()) == 1) {
    return std::nullopt;
  }
  return detail::address_from_point(group.get(), public_point.get(),
                                    ctx.get());
}

bool verify_signature(const warden::schema::hash32_t& digest,
                      const warden::schema::address_t& signer,
                      const warden::schema::signature_t& signature) {
  auto recovered = recover_address(digest, signature);
  return recovered.has_value() && *recovered == signer;
}

}  // namespace warden::crypto
