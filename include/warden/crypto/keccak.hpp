#pragma once
#include <warden/schema/primitives.hpp>

#include <span>
#include <string_view>

namespace warden::crypto {

/// Original Keccak-256 (pad byte 0x01), as used by the EVM. Not NIST SHA3-256.
warden::schema::hash32_t keccak256(const std::span<const uint8_t>& bytes);
warden::schema::hash32_t keccak256(const std::string_view& str);

}  // namespace warden::crypto
