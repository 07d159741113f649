#include <warden/storage/rocksdb/storage.hpp>

namespace warden::storage {

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::db() const {
  if (!database) {
    throw storage_error{"RocksDB database is not initialized"};
  }
  return *database;
}

ROCKSDB_NAMESPACE::WriteOptions storage<rocksdb_storage_tag>::write_options()
    const {
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = options.sync_writes;
  return write_options;
}

std::optional<warden::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const warden::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status =
      db().Get(ROCKSDB_NAMESPACE::ReadOptions{}, detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw storage_error{"failed to read from RocksDB: " + status.ToString()};
  }
  return warden::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::commit(const write_batch_t& batch) const {
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto delete_status = rocks_batch.Delete(detail::to_slice(key));
    if (!delete_status.ok()) {
      throw storage_error{"failed staging delete: " +
                          delete_status.ToString()};
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto put_status =
        rocks_batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      throw storage_error{"failed staging put: " + put_status.ToString()};
    }
  }
  auto status = db().Write(write_options(), &rocks_batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    throw storage_error{"failed to commit RocksDB batch: " +
                        status.ToString()};
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const warden::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      db().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    throw storage_error{"failed to scan RocksDB: " +
                        iterator->status().ToString()};
  }
  return entries;
}

void storage<rocksdb_storage_tag>::flush() const {
  auto status = db().FlushWAL(true);
  if (!status.ok()) {
    throw storage_error{"failed to flush RocksDB WAL: " + status.ToString()};
  }
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options_t& options) {
  auto store = storage<rocksdb_storage_tag>();
  store.options = options;

  auto rocks_options = ROCKSDB_NAMESPACE::Options{};
  rocks_options.create_if_missing = options.create_if_missing;
  rocks_options.IncreaseParallelism();
  rocks_options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(rocks_options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    throw storage_error{"failed to open RocksDB at " + std::string{path} +
                        ": " + status.ToString()};
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace warden::storage
