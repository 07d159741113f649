#pragma once
#include <warden/schema/primitives.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::storage {

using key_value_entry_t =
    std::pair<warden::schema::bytes_t, warden::schema::bytes_t>;

/// I/O fault reported by a storage backend. Missing keys are not faults.
class storage_error final : public std::runtime_error {
 public:
  explicit storage_error(const std::string& message)
      : std::runtime_error{message} {}
};

/// Puts and deletes applied as one atomic unit.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<warden::schema::bytes_t> deletes;
};

using write_batch_t = write_batch;

struct storage_options final {
  /// fsync the write-ahead log before a write returns.
  bool sync_writes{true};
  bool create_if_missing{true};
};

using storage_options_t = storage_options;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing or
  /// undecodable.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const warden::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<warden::schema::bytes_t> get_raw(
      const warden::schema::bytes_view_t& key) const;

  /// Apply every put and delete atomically.
  void commit(const write_batch_t& batch) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;

  /// Force buffered log data to stable storage.
  void flush() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              const storage_options_t& options = {});

}  // namespace warden::storage
