#pragma once
#include <warden/schema/primitives.hpp>

#include <string>
#include <variant>
#include <vector>

// Solidity ABI encoding (abi.encode) for flat parameter lists.
namespace warden::abi {

/// One parameter. Words (uint256, bytes32, address) are static; strings and
/// byte arrays are dynamic and placed in the tail.
using argument_t = std::variant<warden::schema::uint256_t,
                                warden::schema::hash32_t,
                                warden::schema::address_t,
                                bool,
                                std::string,
                                warden::schema::bytes_t>;

warden::schema::bytes_t encode(const std::vector<argument_t>& arguments);

}  // namespace warden::abi
