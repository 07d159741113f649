#include <blake3.h>
#include <warden/blake3/hash.hpp>

namespace warden::blake3 {

namespace {

warden::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  static_assert(BLAKE3_OUT_LEN == 32);
  auto output = warden::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

warden::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

warden::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace warden::blake3
