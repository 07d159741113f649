#include <gtest/gtest.h>
#include <warden/crypto/keccak.hpp>

#include <string>

namespace {

std::string keccak_hex(const std::string& input) {
  return warden::schema::to_hex(warden::crypto::keccak256(input));
}

}  // namespace

TEST(keccak, empty_input) {
  EXPECT_EQ(keccak_hex(""),
            "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a47"
            "0");
}

TEST(keccak, short_input) {
  EXPECT_EQ(keccak_hex("abc"),
            "0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c4"
            "5");
}

TEST(keccak, inputs_around_the_rate_boundary) {
  EXPECT_EQ(keccak_hex(std::string(135, 'a')),
            "0x34367dc248bbd832f4e3e69dfaac2f92638bd0bbd18f2912ba4ef454919cf44"
            "6");
  EXPECT_EQ(keccak_hex(std::string(136, 'a')),
            "0xa6c4d403279fe3e0af03729caada8374b5ca54d8065329a3ebcaeb4b60aa386"
            "e");
  EXPECT_EQ(keccak_hex(std::string(200, 'a')),
            "0x96ea54061def936c4be90b518992fdc6f12f535068a256229aca54267b4d084"
            "d");
}

TEST(keccak, span_and_string_overloads_agree) {
  auto text = std::string{"submission:proposal-0001"};
  auto bytes = warden::schema::make_bytes(text);
  EXPECT_EQ(warden::crypto::keccak256(std::span<const uint8_t>{bytes}),
            warden::crypto::keccak256(text));
  EXPECT_EQ(warden::schema::to_hex(warden::crypto::keccak256(text)),
            "0x8c88c8a86cd17df39dc81034a0935fba342141e1a717b3a4b29d8a4be579f85"
            "9");
}
