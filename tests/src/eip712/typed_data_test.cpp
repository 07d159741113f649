#include <gtest/gtest.h>
#include <warden/crypto/signing_key.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/eip712/typed_data.hpp>

#include <string>

namespace {

using warden::eip712::field_t;
using warden::eip712::struct_value_t;
using warden::eip712::value_t;

// The example from the EIP-712 proposal.
warden::eip712::type_definitions_t mail_types() {
  return warden::eip712::type_definitions_t{
      {"Person",
       {field_t{.name = "name", .type = "string"},
        field_t{.name = "wallet", .type = "address"}}},
      {"Mail",
       {field_t{.name = "from", .type = "Person"},
        field_t{.name = "to", .type = "Person"},
        field_t{.name = "contents", .type = "string"}}}};
}

struct_value_t person(const std::string& name, const std::string& wallet) {
  return struct_value_t{value_t{name},
                        value_t{warden::schema::make_address(wallet)}};
}

struct_value_t mail() {
  return struct_value_t{
      value_t{person("Cow", "0xCD2a3d9F938E13CD947Ec05AbC7FE734Df8DD826")},
      value_t{person("Bob", "0xbBbBBBBbbBBBbbbBbbBbbbbBBbBbbbbBbBbbBBbB")},
      value_t{std::string{"Hello, Bob!"}}};
}

warden::eip712::domain_t mail_domain() {
  return warden::eip712::domain_t{
      .name = "Ether Mail",
      .version = "1",
      .chain_id = 1,
      .verifying_contract = warden::schema::make_address(
          "0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC")};
}

}  // namespace

TEST(typed_data, encodes_referenced_types_after_the_primary) {
  EXPECT_EQ(warden::eip712::encode_type(mail_types(), "Mail"),
            "Mail(Person from,Person to,string contents)"
            "Person(string name,address wallet)");
  EXPECT_EQ(warden::eip712::encode_type(mail_types(), "Person"),
            "Person(string name,address wallet)");
  EXPECT_EQ(warden::schema::to_hex(
                *warden::eip712::type_hash(mail_types(), "Mail")),
            "0xa0cedeb2dc280ba39b857546d74f5549c3a1d7bdc2dd96bf881f76108e23dac"
            "2");
}

TEST(typed_data, unknown_types_do_not_encode) {
  EXPECT_TRUE(warden::eip712::encode_type(mail_types(), "Letter").empty());
  EXPECT_FALSE(warden::eip712::type_hash(mail_types(), "Letter").has_value());

  auto without_person = mail_types();
  without_person.erase("Person");
  EXPECT_FALSE(warden::eip712::hash_struct(without_person, "Mail", mail())
                   .has_value());
}

TEST(typed_data, reproduces_the_mail_example) {
  auto separator = warden::eip712::domain_separator(mail_domain());
  EXPECT_EQ(warden::schema::to_hex(separator),
            "0xf2cee375fa42b42143804025fc449deafd50cc031ca257e0b194a650a912090"
            "f");

  auto struct_hash = warden::eip712::hash_struct(mail_types(), "Mail", mail());
  ASSERT_TRUE(struct_hash.has_value());
  EXPECT_EQ(warden::schema::to_hex(*struct_hash),
            "0xc52c0ee5d84264471806290a3f2c4cecfc5490626bf912d01f240d7a274b371"
            "e");

  auto digest = warden::eip712::digest(separator, *struct_hash);
  EXPECT_EQ(warden::schema::to_hex(digest),
            "0xbe609aee343fb3c4b28e1df9e632fca64fcfaede20f02e86244efddf30957bd"
            "2");

  // The example signs with keccak256("cow").
  auto key = warden::crypto::signing_key::from_hex(
      "0xc85ef7d79691fe79573b1a7064c19c1a9819ebdbd1faaab1a8ec92344438aaf4");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(warden::schema::to_hex(key->address()),
            "0xcd2a3d9f938e13cd947ec05abc7fe734df8dd826");
  auto signature = key->sign_digest(digest);
  EXPECT_EQ(warden::schema::to_hex(signature),
            "0x4355c47d63924e8a72e509b65029052eb6c299d53a04e167c5775fd466751c9d"
            "07299936d304c153f6443dfa05f40ff007d72911b6f72307f996231605b91562"
            "1c");
}

TEST(typed_data, mismatched_values_do_not_hash) {
  auto values = mail();
  values.pop_back();
  EXPECT_FALSE(
      warden::eip712::hash_struct(mail_types(), "Mail", values).has_value());

  auto wrong_kind = mail();
  wrong_kind[2] = value_t{true};
  EXPECT_FALSE(warden::eip712::hash_struct(mail_types(), "Mail", wrong_kind)
                   .has_value());
}

TEST(typed_data, narrow_integers_reject_out_of_range_values) {
  auto types = warden::eip712::type_definitions_t{
      {"Tick", {field_t{.name = "height", .type = "uint64"}}}};
  auto fits = struct_value_t{
      value_t{warden::schema::uint256_t{"18446744073709551615"}}};
  EXPECT_TRUE(warden::eip712::hash_struct(types, "Tick", fits).has_value());

  auto too_wide = struct_value_t{
      value_t{warden::schema::uint256_t{"18446744073709551616"}}};
  EXPECT_FALSE(
      warden::eip712::hash_struct(types, "Tick", too_wide).has_value());
}
