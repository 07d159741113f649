#include <gtest/gtest.h>
#include <warden/crypto/keccak.hpp>
#include <warden/crypto/signing_key.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/testing/common.hpp>

#include <algorithm>
#include <set>
#include <string>

namespace {

warden::crypto::signing_key make_key(const std::string_view hex) {
  auto key = warden::crypto::signing_key::from_hex(hex);
  EXPECT_TRUE(key.has_value());
  return *key;
}

warden::schema::hash32_t secret_from_uint(const uint64_t value) {
  return warden::schema::to_word(warden::schema::uint256_t{value});
}

// secp256k1 group order.
constexpr auto kOrder = std::string_view{
    "0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"};

}  // namespace

TEST(secp256k1, derives_ethereum_addresses) {
  EXPECT_EQ(warden::schema::to_hex(
                make_key(warden::testing::kSignerSecret).address()),
            warden::testing::kSignerAddress);
  EXPECT_EQ(warden::schema::to_hex(
                make_key(warden::testing::kOtherSecret).address()),
            "0x70997970c51812dc3a010c7d01b50e0d17dc79c8");

  auto one = warden::crypto::signing_key::from_secret(secret_from_uint(1));
  ASSERT_TRUE(one.has_value());
  EXPECT_EQ(warden::schema::to_hex(one->address()),
            "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
}

TEST(secp256k1, rejects_out_of_range_secrets) {
  EXPECT_FALSE(warden::crypto::signing_key::from_secret(
                   warden::schema::make_zero_hash())
                   .has_value());
  EXPECT_FALSE(warden::crypto::signing_key::from_hex(kOrder).has_value());
  EXPECT_FALSE(warden::crypto::signing_key::from_hex("0x1234").has_value());
  EXPECT_FALSE(warden::crypto::signing_key::from_hex("not hex").has_value());
}

TEST(secp256k1, from_hex_tolerates_surrounding_whitespace) {
  auto key = warden::crypto::signing_key::from_hex(
      std::string{"  "} + std::string{warden::testing::kSignerSecret} + "\n");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(warden::schema::to_hex(key->address()),
            warden::testing::kSignerAddress);
}

TEST(secp256k1, deterministic_signature_matches_reference) {
  auto key = warden::crypto::signing_key::from_secret(secret_from_uint(1));
  ASSERT_TRUE(key.has_value());
  auto signature = key->sign_digest(warden::schema::make_zero_hash());
  EXPECT_EQ(warden::schema::to_hex(signature),
            "0xa0b37f8fba683cc68f6574cd43b39f0343a50008bf6ccea9d13231d9e7e2e1e4"
            "11edc8d307254296264aebfc3dc76cd8b668373a072fd64665b50000e9fcce52"
            "1c");
  EXPECT_EQ(signature, key->sign_digest(warden::schema::make_zero_hash()));
}

TEST(secp256k1, recovers_the_signer) {
  auto key = make_key(warden::testing::kSignerSecret);
  auto digest = warden::crypto::keccak256(std::string_view{"hello"});
  auto signature = key.sign_digest(digest);

  EXPECT_TRUE(signature[64] == 27 || signature[64] == 28);
  auto recovered = warden::crypto::recover_address(digest, signature);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, key.address());
  EXPECT_TRUE(warden::crypto::verify_signature(digest, key.address(),
                                               signature));

  // Raw recovery ids are accepted as well.
  auto raw = signature;
  raw[64] = static_cast<uint8_t>(raw[64] - 27);
  EXPECT_EQ(warden::crypto::recover_address(digest, raw), recovered);
}

TEST(secp256k1, rejects_tampered_signatures) {
  auto key = make_key(warden::testing::kSignerSecret);
  auto digest = warden::crypto::keccak256(std::string_view{"hello"});
  auto signature = key.sign_digest(digest);

  auto other_digest = warden::crypto::keccak256(std::string_view{"hellp"});
  EXPECT_FALSE(warden::crypto::verify_signature(other_digest, key.address(),
                                                signature));

  auto flipped = signature;
  flipped[64] = signature[64] == 27 ? 28 : 27;
  EXPECT_FALSE(warden::crypto::verify_signature(digest, key.address(),
                                                flipped));

  auto bad_v = signature;
  bad_v[64] = 30;
  EXPECT_FALSE(warden::crypto::recover_address(digest, bad_v).has_value());

  auto zero_r = signature;
  std::fill(std::begin(zero_r), std::begin(zero_r) + 32, uint8_t{0});
  EXPECT_FALSE(warden::crypto::recover_address(digest, zero_r).has_value());
}

TEST(secp256k1, rejects_high_s_signatures) {
  auto key = make_key(warden::testing::kSignerSecret);
  auto digest = warden::crypto::keccak256(std::string_view{"malleable"});
  auto signature = key.sign_digest(digest);

  // (r, n - s) with the opposite parity verifies under plain ECDSA.
  auto order = warden::schema::from_word(
      warden::schema::make_bytes_view(*warden::schema::try_from_hex(kOrder)));
  auto s = warden::schema::from_word(
      warden::schema::bytes_view_t{signature.data() + 32, 32});
  auto high_s = warden::schema::to_word(order - s);
  auto malleable = signature;
  std::copy(std::begin(high_s), std::end(high_s), std::begin(malleable) + 32);
  malleable[64] = signature[64] == 27 ? 28 : 27;

  EXPECT_FALSE(warden::crypto::recover_address(digest, malleable).has_value());
}

TEST(secp256k1, signatures_are_low_s_with_a_matching_recovery_id) {
  auto key = make_key(warden::testing::kOtherSecret);
  auto order = warden::schema::from_word(
      warden::schema::make_bytes_view(*warden::schema::try_from_hex(kOrder)));
  auto seen_v = std::set<uint8_t>{};

  // Enough digests that roughly half start out with a high s.
  for (auto i = 0; i < 32; ++i) {
    auto digest = warden::crypto::keccak256(
        std::string_view{"digest " + std::to_string(i)});
    auto signature = key.sign_digest(digest);

    auto s = warden::schema::from_word(
        warden::schema::bytes_view_t{signature.data() + 32, 32});
    EXPECT_LE(s, order / 2) << i;
    EXPECT_TRUE(warden::crypto::verify_signature(digest, key.address(),
                                                 signature))
        << i;
    EXPECT_EQ(signature, key.sign_digest(digest)) << i;
    seen_v.insert(signature[64]);
  }
  EXPECT_EQ(seen_v, (std::set<uint8_t>{27, 28}));
}
