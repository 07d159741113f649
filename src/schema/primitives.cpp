#include <warden/common/critical.hpp>
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace warden::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = "0123456789abcdef";
  auto out = std::string{"0x"};
  out.reserve(2 + bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHex[(value >> 4u) & 0x0Fu]);
    out.push_back(kHex[value & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<hash32_t> try_make_hash32(const std::string_view hex) {
  return try_make_fixed<32>(hex);
}

std::optional<address_t> try_make_address(const std::string_view hex) {
  return try_make_fixed<20>(hex);
}

hash32_t make_hash32(const std::string_view hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    warden::common::critical("make_hash32 expected 32 hex-encoded bytes");
  }
  return *hash;
}

address_t make_address(const std::string_view hex) {
  auto address = try_make_address(hex);
  if (!address) {
    warden::common::critical("make_address expected 20 hex-encoded bytes");
  }
  return *address;
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

hash32_t to_word(const uint256_t& value) {
  auto word = hash32_t{};
  auto remaining = value;
  for (auto i = word.size(); i > 0; --i) {
    word[i - 1] = static_cast<uint8_t>(remaining & 0xFF);
    remaining >>= 8;
  }
  return word;
}

uint256_t from_word(const bytes_view_t& word) {
  auto value = uint256_t{0};
  for (const auto byte : word) {
    value <<= 8;
    value |= byte;
  }
  return value;
}

}  // namespace warden::schema
