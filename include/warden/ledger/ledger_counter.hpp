#pragma once
#include <warden/ledger/attestation_ledger.hpp>
#include <warden/ledger/counter_word.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace warden::ledger {

/// Per-submitter attestation counter wrapping an attestation ledger.
///
/// Each address owns one packed word (see counter_word.hpp). Calls are
/// serialised the way the chain orders transactions; a call that throws
/// revert_error leaves every word as it was.
class ledger_counter final {
 public:
  using words_t =
      std::map<warden::schema::address_t, warden::schema::uint256_t>;

  /// Throws revert_error(ZeroAddress) for a missing ledger or a ledger at the
  /// zero address. `genesis` seeds raw storage words.
  ledger_counter(warden::schema::address_t controller,
                 std::shared_ptr<attestation_ledger> ledger,
                 words_t genesis = {});

  const warden::schema::address_t& controller() const;
  warden::schema::address_t ledger_address() const;

  /// Controller only. Touches bit 255 of `signer`'s word and nothing else.
  void set_active(const warden::schema::address_t& caller,
                  const warden::schema::address_t& signer,
                  bool active);

  /// Increment `caller`'s count, then forward to the ledger. A ledger revert
  /// or an overflow rolls the increment back and propagates.
  warden::schema::hash32_t forward_attestation(
      const warden::schema::address_t& caller,
      const warden::attestation::attest_request_t& request,
      const warden::schema::signature_t& signature);

  warden::schema::uint256_t get_count(
      const warden::schema::address_t& signer) const;
  bool is_active(const warden::schema::address_t& signer) const;
  counter_info_t get_info(const warden::schema::address_t& signer) const;

  /// Raw storage word, zero for addresses never touched.
  warden::schema::uint256_t word(const warden::schema::address_t& signer) const;

 private:
  warden::schema::uint256_t load(const warden::schema::address_t& signer) const;

  warden::schema::address_t controller_;
  std::shared_ptr<attestation_ledger> ledger_;
  mutable std::mutex mutex_;
  words_t words_;
};

}  // namespace warden::ledger
