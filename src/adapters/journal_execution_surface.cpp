#include <spdlog/spdlog.h>
#include <warden/abi/encode.hpp>
#include <warden/adapters/journal_execution_surface.hpp>
#include <warden/attestation/payload.hpp>
#include <warden/crypto/keccak.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key/keys.hpp>

#include <tuple>

namespace warden::adapters {

namespace {

// reference, verdict, decision_digest
using journal_row_t =
    std::tuple<std::string, uint8_t, warden::schema::hash32_t>;

std::string make_reference(const std::string_view source_key,
                           const std::string_view item_id,
                           const warden::schema::hash32_t& digest) {
  auto encoded = warden::abi::encode(
      {std::string{source_key}, std::string{item_id}, digest});
  return warden::schema::to_hex(
      warden::crypto::keccak256(std::span<const uint8_t>{encoded}));
}

}  // namespace

journal_execution_surface::journal_execution_surface(
    warden::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

warden::schema::outcome_t<std::string> journal_execution_surface::submit(
    const std::string_view source_key,
    const warden::schema::decision_t& decision) {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto key =
      warden::schema::key::make_submission_key(source_key, decision.item_id);
  try {
    if (auto existing = storage_.get<warden::schema::encoding::scale_encoder_t,
                                     journal_row_t>(encoder, key)) {
      return std::get<0>(*existing);
    }
    auto digest = warden::attestation::decision_digest(decision);
    auto reference = make_reference(source_key, decision.item_id, digest);
    storage_.put(encoder, key,
                 journal_row_t{reference,
                               static_cast<uint8_t>(decision.verdict), digest});
    spdlog::info("journal: '{}' {} recorded as {}", decision.item_id,
                 warden::schema::to_string(decision.verdict), reference);
    return reference;
  } catch (const warden::storage::storage_error& e) {
    return warden::schema::transient_error(e.what());
  }
}

warden::schema::outcome_t<std::optional<std::string>>
journal_execution_surface::find_submission(const std::string_view item_id,
                                           const std::string_view source_key) {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  try {
    auto row = storage_.get<warden::schema::encoding::scale_encoder_t,
                            journal_row_t>(
        encoder, warden::schema::key::make_submission_key(source_key, item_id));
    if (!row) {
      return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::get<0>(*row)};
  } catch (const warden::storage::storage_error& e) {
    return warden::schema::transient_error(e.what());
  }
}

}  // namespace warden::adapters
