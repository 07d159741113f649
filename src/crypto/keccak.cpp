#include <openssl/evp.h>
#include <warden/common/critical.hpp>
#include <warden/crypto/keccak.hpp>

#include <memory>

namespace warden::crypto {

namespace {

using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;

// Legacy-padded Keccak, not the "SHA3-256" digest.
const EVP_MD* keccak_digest() {
  static const auto digest = evp_md_ptr{
      EVP_MD_fetch(nullptr, "KECCAK-256", nullptr), EVP_MD_free};
  if (!digest) {
    warden::common::critical("KECCAK-256 unavailable in OpenSSL provider");
  }
  return digest.get();
}

}  // namespace

warden::schema::hash32_t keccak256(const std::span<const uint8_t>& bytes) {
  auto out = warden::schema::hash32_t{};
  auto out_size = 0u;
  if (EVP_Digest(bytes.data(), bytes.size(), out.data(), &out_size,
                 keccak_digest(), nullptr) != 1 ||
      out_size != out.size()) {
    warden::common::critical("Keccak-256 digest failed");
  }
  return out;
}

warden::schema::hash32_t keccak256(const std::string_view& str) {
  return keccak256(warden::schema::make_bytes_view(str));
}

}  // namespace warden::crypto
