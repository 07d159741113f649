#include <algorithm>
#include <iterator>
#include <ranges>
#include <warden/blake3/hash.hpp>
#include <warden/schema/key/builder.hpp>

using namespace warden::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::string_view& str) {
  auto digest = warden::blake3::hash(str);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  auto digest = warden::blake3::hash(bytes);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}
