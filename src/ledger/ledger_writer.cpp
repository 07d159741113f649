#include <spdlog/spdlog.h>
#include <warden/ledger/ledger_writer.hpp>
#include <warden/ledger/revert_error.hpp>

namespace warden::ledger {

counter_writer::counter_writer(ledger_counter& counter,
                               warden::schema::address_t submitter,
                               const bool require_active_signer)
    : counter_{counter},
      submitter_{submitter},
      require_active_signer_{require_active_signer} {}

warden::schema::outcome_t<warden::schema::hash32_t> counter_writer::write(
    const warden::attestation::signed_attestation_t& attestation) {
  if (require_active_signer_ && !counter_.is_active(submitter_)) {
    spdlog::warn("submitter {} is not active on the ledger counter",
                 warden::schema::to_hex(submitter_));
    return warden::schema::rejected_error(std::string{kSignerInactive});
  }
  try {
    auto record_id = counter_.forward_attestation(
        submitter_, attestation.request, attestation.signature);
    spdlog::info("attestation recorded as {} (submitter count {})",
                 warden::schema::to_hex(record_id),
                 counter_.get_count(submitter_).str());
    return record_id;
  } catch (const revert_error& e) {
    return warden::schema::rejected_error(std::string{e.reason()});
  }
}

}  // namespace warden::ledger
