#pragma once
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace warden::schema::key {

struct builder final {
  warden::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  /// Little-endian, for fixed-width key components.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }

  /// Big-endian, for components that must sort numerically in RocksDB.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write_ordered(T value) {
    for (size_t i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace warden::schema::key
