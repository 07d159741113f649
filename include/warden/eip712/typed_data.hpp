#pragma once
#include <warden/schema/primitives.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// EIP-712 typed structured data hashing.
//
// Supported member types: address, bool, string, bytes, bytes32, uint8..uint256
// and references to other struct types. Arrays are not supported.
namespace warden::eip712 {

struct field final {
  std::string name;
  std::string type;
};

using field_t = field;

/// Struct name -> ordered member list.
using type_definitions_t = std::map<std::string, std::vector<field_t>>;

struct value;

/// Member values of one struct, in declaration order.
using struct_value_t = std::vector<value>;

struct value final {
  std::variant<warden::schema::address_t,
               warden::schema::hash32_t,
               warden::schema::uint256_t,
               bool,
               std::string,
               warden::schema::bytes_t,
               struct_value_t>
      data;
};

using value_t = value;

struct domain final {
  std::string name;
  std::string version;
  uint64_t chain_id{};
  warden::schema::address_t verifying_contract{};
};

using domain_t = domain;

/// `Name(type1 name1,...)` followed by every referenced struct type, sorted
/// by name. Empty when `primary` or a referenced type is undefined.
std::string encode_type(const type_definitions_t& types,
                        const std::string& primary);

std::optional<warden::schema::hash32_t> type_hash(
    const type_definitions_t& types,
    const std::string& primary);

/// keccak256(typeHash || encodeData(values)). Fails when the value count or
/// a value's alternative does not match the declared member type.
std::optional<warden::schema::hash32_t> hash_struct(
    const type_definitions_t& types,
    const std::string& primary,
    const struct_value_t& values);

/// hashStruct of EIP712Domain(string name,string version,uint256 chainId,
/// address verifyingContract).
warden::schema::hash32_t domain_separator(const domain_t& domain);

/// keccak256(0x19 0x01 || domainSeparator || structHash).
warden::schema::hash32_t digest(const warden::schema::hash32_t& separator,
                                const warden::schema::hash32_t& struct_hash);

}  // namespace warden::eip712
