#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using uint256_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using timestamp_seconds_t = uint64_t;

/// 65-byte Ethereum-style signature laid out as [r || s || v].
using signature_t = std::array<uint8_t, 65>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Lower-case hex with a "0x" prefix.
std::string to_hex(const bytes_view_t& bytes);

/// Accepts an optional "0x"/"0X" prefix; rejects odd length or bad digits.
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::optional<hash32_t> try_make_hash32(std::string_view hex);
std::optional<address_t> try_make_address(std::string_view hex);
hash32_t make_hash32(std::string_view hex);
address_t make_address(std::string_view hex);
hash32_t make_zero_hash();

template <std::size_t N>
bool is_zero(const std::array<uint8_t, N>& value) {
  for (const auto byte : value) {
    if (byte != 0) {
      return false;
    }
  }
  return true;
}

/// Big-endian 32-byte word, as used by ABI and EIP-712 encodings.
hash32_t to_word(const uint256_t& value);
uint256_t from_word(const bytes_view_t& word);

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
