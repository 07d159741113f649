#include <warden/common/critical.hpp>
#include <warden/ledger/counter_word.hpp>

namespace warden::ledger {

const warden::schema::uint256_t& active_bit() {
  static const auto bit = warden::schema::uint256_t{1} << 255;
  return bit;
}

const warden::schema::uint256_t& max_count() {
  static const auto max = active_bit() - 1;
  return max;
}

warden::schema::uint256_t pack(const bool active,
                               const warden::schema::uint256_t& count) {
  if (count > max_count()) {
    warden::common::critical("counter value does not fit in 255 bits");
  }
  return active ? (count | active_bit()) : count;
}

counter_info_t unpack(const warden::schema::uint256_t& word) {
  return counter_info_t{.count = word & max_count(),
                        .active = (word & active_bit()) != 0};
}

warden::schema::uint256_t with_active(const warden::schema::uint256_t& word,
                                      const bool active) {
  return pack(active, unpack(word).count);
}

std::optional<warden::schema::uint256_t> incremented(
    const warden::schema::uint256_t& word) {
  auto info = unpack(word);
  if (info.count == max_count()) {
    return std::nullopt;
  }
  return pack(info.active, info.count + 1);
}

}  // namespace warden::ledger
