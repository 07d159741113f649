#pragma once
#include <scale/scale.hpp>
#include <warden/common/critical.hpp>
#include <warden/schema/encoding/encoder.hpp>

namespace warden::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec over the tuple rows in encoding/scale/*.hpp.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  warden::schema::bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      // Rows are plain tuples of fixed types; encoding them cannot fail.
      warden::common::critical("SCALE encoding of a row failed");
    }
    return std::move(encoded.value());
  }

  template <typename T>
  std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      spdlog::debug("SCALE decode of {} bytes failed", bytes.size());
      return std::nullopt;
    }
    return std::move(decoded.value());
  }
};

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace warden::schema::encoding
