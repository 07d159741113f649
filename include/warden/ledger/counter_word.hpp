#pragma once
#include <warden/schema/primitives.hpp>

#include <optional>

// Storage word of one signer in the ledger counter. Bit 255 is the active
// flag, bits 0..254 the attestation count. Every read and write of a word goes
// through these functions.
namespace warden::ledger {

struct counter_info final {
  warden::schema::uint256_t count{};
  bool active{false};
};

using counter_info_t = counter_info;

const warden::schema::uint256_t& active_bit();

/// 2^255 - 1.
const warden::schema::uint256_t& max_count();

/// `count` must not exceed max_count().
warden::schema::uint256_t pack(bool active,
                               const warden::schema::uint256_t& count);
counter_info_t unpack(const warden::schema::uint256_t& word);

/// Same count, new flag.
warden::schema::uint256_t with_active(const warden::schema::uint256_t& word,
                                      bool active);

/// Count + 1 with the flag preserved; nullopt at max_count().
std::optional<warden::schema::uint256_t> incremented(
    const warden::schema::uint256_t& word);

}  // namespace warden::ledger
