#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/checkpoint/rocksdb_store.hpp>
#include <warden/common/critical.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/encoding/scale/run_checkpoint.hpp>
#include <warden/schema/key/keys.hpp>

#include <tuple>

namespace warden::checkpoint {

namespace {

// schema version, blake3(body), body
using envelope_row_t = std::tuple<uint16_t,
                                  warden::schema::hash32_t,
                                  warden::schema::bytes_t>;

std::optional<uint64_t> backup_sequence(
    const warden::schema::bytes_t& key,
    const warden::schema::bytes_t& prefix) {
  if (key.size() != prefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  auto sequence = uint64_t{0};
  for (auto i = prefix.size(); i < key.size(); ++i) {
    sequence = (sequence << 8) | key[i];
  }
  return sequence;
}

template <typename Row>
std::optional<warden::schema::run_checkpoint_t> decode_body(
    const warden::schema::bytes_t& body) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<Row>(warden::schema::make_bytes_view(body));
  if (!decoded) {
    return std::nullopt;
  }
  return warden::schema::encoding::scale::from_row(*decoded);
}

std::string describe(const std::exception& e) {
  return std::string{"checkpoint storage fault: "} + e.what();
}

}  // namespace

warden::schema::bytes_t make_envelope(
    const warden::schema::run_checkpoint_t& checkpoint) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto body =
      encoder.encode(warden::schema::encoding::scale::to_row(checkpoint));
  auto checksum =
      warden::blake3::hash(warden::schema::make_bytes_view(body));
  return encoder.encode(envelope_row_t{
      warden::schema::run_checkpoint_t::version, checksum, std::move(body)});
}

std::optional<warden::schema::run_checkpoint_t> open_envelope(
    const warden::schema::bytes_view_t& envelope) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto row = encoder.try_decode<envelope_row_t>(envelope);
  if (!row) {
    return std::nullopt;
  }
  const auto& [version, checksum, body] = *row;
  if (warden::blake3::hash(warden::schema::make_bytes_view(body)) !=
      checksum) {
    return std::nullopt;
  }
  switch (version) {
    case 1:
      return decode_body<
          warden::schema::encoding::scale::run_checkpoint_row_v1_t>(body);
    case warden::schema::run_checkpoint_t::version:
      return decode_body<
          warden::schema::encoding::scale::run_checkpoint_row_t>(body);
    default:
      spdlog::warn("checkpoint envelope has unknown version {}", version);
      return std::nullopt;
  }
}

rocksdb_store::rocksdb_store(warden::storage::rocksdb_storage_t& storage,
                             const size_t max_backups)
    : storage_{storage}, max_backups_{max_backups} {}

warden::schema::run_checkpoint_t rocksdb_store::load(
    const std::string_view source_key) {
  auto lock = std::scoped_lock{mutex_};
  try {
    auto primary =
        storage_.get_raw(warden::schema::key::make_checkpoint_key(source_key));
    if (!primary) {
      return make_checkpoint(source_key);
    }

    auto checkpoint =
        open_envelope(warden::schema::make_bytes_view(*primary));
    if (!checkpoint) {
      spdlog::warn("checkpoint for '{}' is corrupt, trying backups",
                   source_key);
      auto backups = storage_.list_by_prefix(
          warden::schema::key::make_checkpoint_backup_prefix(source_key));
      for (auto it = std::rbegin(backups); it != std::rend(backups); ++it) {
        checkpoint = open_envelope(warden::schema::make_bytes_view(it->second));
        if (checkpoint) {
          spdlog::warn("restored checkpoint for '{}' from backup", source_key);
          break;
        }
      }
    }
    if (!checkpoint) {
      throw store_unavailable_error{"no valid checkpoint or backup for '" +
                                    std::string{source_key} + "'"};
    }
    if (checkpoint->source_key != source_key) {
      throw store_unavailable_error{"checkpoint under '" +
                                    std::string{source_key} +
                                    "' belongs to '" + checkpoint->source_key +
                                    "'"};
    }

    for (const auto& id : repair(*checkpoint)) {
      spdlog::warn("checkpoint '{}' listed '{}' as both in flight and "
                   "completed; keeping the completed entry",
                   source_key, id);
    }
    return *checkpoint;
  } catch (const warden::storage::storage_error& e) {
    throw store_unavailable_error{describe(e)};
  }
}

void rocksdb_store::save(const std::string_view source_key,
                         const warden::schema::run_checkpoint_t& checkpoint) {
  if (checkpoint.source_key != source_key) {
    warden::common::critical("checkpoint saved under a foreign source key");
  }
  auto lock = std::scoped_lock{mutex_};
  try {
    auto key = warden::schema::key::make_checkpoint_key(source_key);
    auto envelope = make_envelope(checkpoint);
    auto previous = storage_.get_raw(key);
    if (previous && *previous == envelope) {
      return;
    }

    auto batch = warden::storage::write_batch_t{};
    batch.puts.emplace_back(key, envelope);
    if (previous && max_backups_ > 0) {
      auto prefix =
          warden::schema::key::make_checkpoint_backup_prefix(source_key);
      auto backups = storage_.list_by_prefix(prefix);
      auto next = uint64_t{0};
      if (!backups.empty()) {
        auto last = backup_sequence(backups.back().first, prefix);
        next = last ? *last + 1 : 0;
      }
      batch.puts.emplace_back(
          warden::schema::key::make_checkpoint_backup_key(source_key, next),
          *previous);
      // Existing slots plus the one being added must fit in max_backups_.
      auto excess = backups.size() + 1 > max_backups_
                        ? backups.size() + 1 - max_backups_
                        : size_t{0};
      for (size_t i = 0; i < excess && i < backups.size(); ++i) {
        batch.deletes.push_back(backups[i].first);
      }
    }
    storage_.commit(batch);
    spdlog::debug("checkpoint '{}' saved ({} in flight, {} completed)",
                  source_key, checkpoint.in_flight.size(),
                  checkpoint.completed.size());
  } catch (const warden::storage::storage_error& e) {
    throw store_unavailable_error{describe(e)};
  }
}

std::vector<std::string> rocksdb_store::list_source_keys() {
  auto lock = std::scoped_lock{mutex_};
  try {
    auto keys = std::vector<std::string>{};
    auto prefix = warden::schema::make_bytes(
        std::string_view{warden::schema::key::kCheckpointPrefix});
    for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
      keys.emplace_back(
          std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()),
          std::end(key));
    }
    return keys;
  } catch (const warden::storage::storage_error& e) {
    throw store_unavailable_error{describe(e)};
  }
}

void rocksdb_store::persist() {
  auto lock = std::scoped_lock{mutex_};
  try {
    storage_.flush();
  } catch (const warden::storage::storage_error& e) {
    throw store_unavailable_error{describe(e)};
  }
}

size_t rocksdb_store::backup_count(const std::string_view source_key) {
  auto lock = std::scoped_lock{mutex_};
  try {
    return storage_
        .list_by_prefix(
            warden::schema::key::make_checkpoint_backup_prefix(source_key))
        .size();
  } catch (const warden::storage::storage_error& e) {
    throw store_unavailable_error{describe(e)};
  }
}

}  // namespace warden::checkpoint
