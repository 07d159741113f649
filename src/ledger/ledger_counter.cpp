#include <spdlog/spdlog.h>
#include <warden/ledger/ledger_counter.hpp>
#include <warden/ledger/revert_error.hpp>

#include <utility>

namespace warden::ledger {

ledger_counter::ledger_counter(warden::schema::address_t controller,
                               std::shared_ptr<attestation_ledger> ledger,
                               words_t genesis)
    : controller_{controller},
      ledger_{std::move(ledger)},
      words_{std::move(genesis)} {
  if (!ledger_ || warden::schema::is_zero(ledger_->address())) {
    throw revert_error{kZeroAddress};
  }
}

const warden::schema::address_t& ledger_counter::controller() const {
  return controller_;
}

warden::schema::address_t ledger_counter::ledger_address() const {
  return ledger_->address();
}

void ledger_counter::set_active(const warden::schema::address_t& caller,
                                const warden::schema::address_t& signer,
                                const bool active) {
  if (caller != controller_) {
    throw revert_error{kUnauthorized};
  }
  auto lock = std::scoped_lock{mutex_};
  words_[signer] = with_active(load(signer), active);
}

warden::schema::hash32_t ledger_counter::forward_attestation(
    const warden::schema::address_t& caller,
    const warden::attestation::attest_request_t& request,
    const warden::schema::signature_t& signature) {
  auto lock = std::scoped_lock{mutex_};
  const auto previous = load(caller);
  auto next = incremented(previous);
  if (!next) {
    throw revert_error{kCounterOverflow};
  }
  words_[caller] = *next;
  try {
    return ledger_->attest_by_delegation(request, signature);
  } catch (const revert_error& e) {
    words_[caller] = previous;
    spdlog::warn("ledger rejected forwarded attestation from {}: {}",
                 warden::schema::to_hex(caller), e.reason());
    throw;
  } catch (...) {
    words_[caller] = previous;
    throw;
  }
}

warden::schema::uint256_t ledger_counter::get_count(
    const warden::schema::address_t& signer) const {
  return get_info(signer).count;
}

bool ledger_counter::is_active(const warden::schema::address_t& signer) const {
  return get_info(signer).active;
}

counter_info_t ledger_counter::get_info(
    const warden::schema::address_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  return unpack(load(signer));
}

warden::schema::uint256_t ledger_counter::word(
    const warden::schema::address_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  return load(signer);
}

warden::schema::uint256_t ledger_counter::load(
    const warden::schema::address_t& signer) const {
  auto it = words_.find(signer);
  if (it == std::end(words_)) {
    return warden::schema::uint256_t{0};
  }
  return it->second;
}

}  // namespace warden::ledger
