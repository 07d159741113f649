#pragma once
#include <warden/checkpoint/store.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <mutex>
#include <optional>

namespace warden::checkpoint {

/// RocksDB-backed checkpoint store.
///
/// Values are SCALE-encoded envelopes `(version, blake3(body), body)`. Each
/// save moves the previous envelope into a numbered backup slot within the
/// same write batch and prunes backups beyond `max_backups`. Loads fall back
/// to the newest valid backup when the primary envelope is corrupt.
class rocksdb_store final : public checkpoint_store {
 public:
  static constexpr auto kDefaultMaxBackups = size_t{5};

  explicit rocksdb_store(warden::storage::rocksdb_storage_t& storage,
                         size_t max_backups = kDefaultMaxBackups);

  warden::schema::run_checkpoint_t load(std::string_view source_key) override;
  void save(std::string_view source_key,
            const warden::schema::run_checkpoint_t& checkpoint) override;
  std::vector<std::string> list_source_keys() override;
  void persist() override;

  /// Number of backup envelopes held for `source_key`.
  size_t backup_count(std::string_view source_key);

 private:
  warden::storage::rocksdb_storage_t& storage_;
  size_t max_backups_;
  std::mutex mutex_;
};

/// Wrap an encoded checkpoint body in a checksummed envelope.
warden::schema::bytes_t make_envelope(
    const warden::schema::run_checkpoint_t& checkpoint);

/// nullopt when the envelope is undecodable, of an unknown version or fails
/// its checksum. Version 1 envelopes are upgraded on the way in.
std::optional<warden::schema::run_checkpoint_t> open_envelope(
    const warden::schema::bytes_view_t& envelope);

}  // namespace warden::checkpoint
