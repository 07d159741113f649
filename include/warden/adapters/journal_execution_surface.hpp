#pragma once
#include <warden/collaborators/execution_surface.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <mutex>

namespace warden::adapters {

/// Execution surface that records submissions in a durable RocksDB journal.
///
/// The reference of a submission is `0x` + keccak256(abi.encode(source_key,
/// item_id, decision_digest)). Submitting an item that is already in the
/// journal returns the journaled reference without writing.
class journal_execution_surface final
    : public warden::collaborators::execution_surface {
 public:
  explicit journal_execution_surface(
      warden::storage::rocksdb_storage_t& storage);

  warden::schema::outcome_t<std::string> submit(
      std::string_view source_key,
      const warden::schema::decision_t& decision) override;

  warden::schema::outcome_t<std::optional<std::string>> find_submission(
      std::string_view item_id,
      std::string_view source_key) override;

 private:
  warden::storage::rocksdb_storage_t& storage_;
  std::mutex mutex_;
};

}  // namespace warden::adapters
