#pragma once
#include <warden/schema/primitives.hpp>

#include <optional>

namespace warden::schema::encoding {

/// Binary codec selected by tag. Persisted rows go through this seam so the
/// storage layer never names the codec library directly.
///
/// `try_decode` returns nullopt for bytes that do not decode as T; stored
/// bytes can be damaged, so decoding never terminates the process.
template <typename Library>
struct encoder {
  template <typename T>
  warden::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes);
};

}  // namespace warden::schema::encoding
