#pragma once
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace warden::blake3 {

warden::schema::hash32_t hash(const std::string_view& str);
warden::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace warden::blake3
