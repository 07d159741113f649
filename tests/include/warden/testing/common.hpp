#pragma once

#include <warden/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::testing {

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline warden::schema::address_t make_address(const uint8_t seed) {
  auto out = warden::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Directory removed on scope exit.
class temp_directory final {
 public:
  explicit temp_directory(const std::string_view prefix)
      : path_{make_temp_path(prefix)} {
    std::filesystem::create_directories(path_);
  }

  temp_directory(const temp_directory&) = delete;
  temp_directory& operator=(const temp_directory&) = delete;

  ~temp_directory() { remove_path(path_); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

// Well-known development keys; never hold value.
inline constexpr auto kSignerSecret = std::string_view{
    "0xac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80"};
inline constexpr auto kSignerAddress =
    std::string_view{"0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266"};
inline constexpr auto kOtherSecret = std::string_view{
    "0x59c6995e998f97a5a0044966f0945389dc9e86dae88c7a8412f4603b6b78690d"};

inline constexpr auto kVerifyingContract =
    std::string_view{"0xF095fE4b23958b08D38e52d5d5674bBF0C03cbF6"};
inline constexpr auto kSchemaUid = std::string_view{
    "0x7d917fcbc9a29a9705ff9936ffa599500e4fd902e4486bae317414fe967b307c"};
inline constexpr auto kRecipient =
    std::string_view{"0x70997970C51812dc3A010C7d01b50e0d17dc79C8"};
inline constexpr auto kChainId = uint64_t{8453};

/// 2026-01-01T00:00:00Z.
inline constexpr auto kEpochSeconds = uint64_t{1767225600};

}  // namespace warden::testing
