#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ecdsa.h>
#include <openssl/param_build.h>
#include <openssl/params.h>
#include <warden/common/critical.hpp>
#include <warden/crypto/keccak.hpp>
#include <warden/crypto/signing_key.hpp>
#include <warden/crypto/verify.hpp>

#include "secp256k1_detail.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <vector>

namespace warden::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using params_ptr =
    std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_clear_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

// OpenSSL key pair for `secret`, public point included.
evp_pkey_ptr make_key_pair(const warden::schema::hash32_t& secret) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto group = detail::make_secp256k1_group();
  auto ctx = detail::make_bn_ctx();
  auto d = detail::make_bignum(secret);
  if (!group || !ctx || !d) {
    return none;
  }
  auto point = detail::make_point(group.get());
  auto public_key = std::array<uint8_t, 65>{};
  if (!point ||
      EC_POINT_mul(group.get(), point.get(), d.get(), nullptr, nullptr,
                   ctx.get()) != 1 ||
      EC_POINT_point2oct(group.get(), point.get(),
                         POINT_CONVERSION_UNCOMPRESSED, public_key.data(),
                         public_key.size(), ctx.get()) != public_key.size()) {
    return none;
  }

  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!builder ||
      OSSL_PARAM_BLD_push_utf8_string(builder.get(),
                                      OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1",
                                      0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             d.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.data(),
                                       public_key.size()) != 1) {
    return none;
  }
  auto params = params_ptr{OSSL_PARAM_BLD_to_param(builder.get()),
                           OSSL_PARAM_clear_free};
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!params || !key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return none;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return none;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

// DER-encoded ECDSA signature over a prehashed digest, nonce per RFC 6979.
std::vector<uint8_t> sign_der(EVP_PKEY* key,
                              const warden::schema::hash32_t& digest) {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_from_pkey(nullptr, key, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    warden::common::critical("failed to allocate signing context");
  }
  auto* digest_name = const_cast<char*>("SHA256");
  auto nonce_type = 1u;
  auto params = std::array{
      OSSL_PARAM_construct_utf8_string(OSSL_SIGNATURE_PARAM_DIGEST,
                                       digest_name, 0),
      OSSL_PARAM_construct_uint(OSSL_SIGNATURE_PARAM_NONCE_TYPE, &nonce_type),
      OSSL_PARAM_construct_end()};
  auto der = std::vector<uint8_t>(static_cast<size_t>(EVP_PKEY_get_size(key)));
  auto der_size = der.size();
  if (EVP_PKEY_sign_init_ex(ctx.get(), params.data()) != 1 ||
      EVP_PKEY_sign(ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    warden::common::critical("deterministic ECDSA signing failed");
  }
  der.resize(der_size);
  return der;
}

}  // namespace

std::optional<warden::schema::address_t> detail::address_from_point(
    const EC_GROUP* group,
    const EC_POINT* point,
    BN_CTX* ctx) {
  auto x = make_bignum();
  auto y = make_bignum();
  if (!x || !y ||
      EC_POINT_get_affine_coordinates(group, point, x.get(), y.get(), ctx) !=
          1) {
    return std::nullopt;
  }
  auto encoded = std::array<uint8_t, 64>{};
  if (BN_bn2binpad(x.get(), encoded.data(), 32) != 32 ||
      BN_bn2binpad(y.get(), encoded.data() + 32, 32) != 32) {
    return std::nullopt;
  }
  auto hashed = keccak256(std::span<const uint8_t>{encoded});
  auto address = warden::schema::address_t{};
  std::copy_n(hashed.data() + 12, address.size(), address.data());
  return address;
}

std::optional<signing_key> signing_key::from_secret(
    const warden::schema::hash32_t& secret) {
  auto group = detail::make_secp256k1_group();
  auto ctx = detail::make_bn_ctx();
  if (!group || !ctx) {
    return std::nullopt;
  }
  auto d = detail::make_bignum(secret);
  const auto* order = EC_GROUP_get0_order(group.get());
  if (!d || BN_is_zero(d.get()) || BN_cmp(d.get(), order) >= 0) {
    return std::nullopt;
  }
  auto public_point = detail::make_point(group.get());
  if (!public_point ||
      EC_POINT_mul(group.get(), public_point.get(), d.get(), nullptr, nullptr,
                   ctx.get()) != 1) {
    return std::nullopt;
  }
  auto address =
      detail::address_from_point(group.get(), public_point.get(), ctx.get());
  if (!address) {
    return std::nullopt;
  }
  return signing_key{secret, *address};
}

std::optional<signing_key> signing_key::from_hex(const std::string_view hex) {
  auto trimmed = hex;
  while (!trimmed.empty() &&
         (trimmed.back() == '\n' || trimmed.back() == '\r' ||
          trimmed.back() == ' ' || trimmed.back() == '\t')) {
    trimmed.remove_suffix(1);
  }
  auto secret = warden::schema::try_make_hash32(trimmed);
  if (!secret) {
    return std::nullopt;
  }
  auto key = from_secret(*secret);
  OPENSSL_cleanse(secret->data(), secret->size());
  return key;
}

signing_key::signing_key(const warden::schema::hash32_t& secret,
                         const warden::schema::address_t& address)
    : secret_{secret}, address_{address} {}

signing_key::~signing_key() {
  OPENSSL_cleanse(secret_.data(), secret_.size());
}

warden::schema::signature_t signing_key::sign_digest(
    const warden::schema::hash32_t& digest) const {
  auto key = make_key_pair(secret_);
  if (!key) {
    warden::common::critical("failed to load secp256k1 key into OpenSSL");
  }
  const auto der = sign_der(key.get(), digest);
  const auto* cursor = der.data();
  auto parsed = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der.size())),
      ECDSA_SIG_free};
  if (!parsed) {
    warden::common::critical("failed to decode ECDSA signature");
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(parsed.get(), &r, &s);

  auto group = detail::make_secp256k1_group();
  if (!group) {
    warden::common::critical("secp256k1 unavailable in OpenSSL");
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  auto half_order = detail::make_bignum();
  auto low_s = detail::make_bignum();
  if (!half_order || !low_s || BN_rshift1(half_order.get(), order) != 1 ||
      BN_copy(low_s.get(), s) == nullptr) {
    warden::common::critical("failed to allocate signing state");
  }
  if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
      BN_sub(low_s.get(), order, s) != 1) {
    warden::common::critical("failed to normalise s");
  }

  auto signature = warden::schema::signature_t{};
  if (BN_bn2binpad(r, signature.data(), 32) != 32 ||
      BN_bn2binpad(low_s.get(), signature.data() + 32, 32) != 32) {
    warden::common::critical("failed to encode signature");
  }
  // OpenSSL does not report the parity of R; pick the id that recovers us.
  for (auto recovery_id = uint8_t{0}; recovery_id < 4; ++recovery_id) {
    signature[64] = static_cast<uint8_t>(27 + recovery_id);
    if (recover_address(digest, signature) == address_) {
      return signature;
    }
  }
  warden::common::critical("no recovery id reproduces the signing address");
}

}  // namespace warden::crypto
