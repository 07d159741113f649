#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <warden/storage/storage.hpp>

#include <iterator>
#include <memory>
#include <string_view>

namespace warden::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const warden::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline warden::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  storage_options_t options;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const warden::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<warden::schema::bytes_t> get_raw(
      const warden::schema::bytes_view_t& key) const;
  void commit(const write_batch_t& batch) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
  void flush() const;

 private:
  ROCKSDB_NAMESPACE::DB& db() const;
  ROCKSDB_NAMESPACE::WriteOptions write_options() const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options_t& options);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const warden::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return encoder.template try_decode<T>(
      warden::schema::bytes_view_t{value->data(), value->size()});
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const warden::schema::bytes_view_t& key,
                                       const T& value) const {
  auto batch = write_batch_t{};
  batch.puts.emplace_back(warden::schema::make_bytes(key),
                          encoder.encode(value));
  commit(batch);
}

}  // namespace warden::storage
