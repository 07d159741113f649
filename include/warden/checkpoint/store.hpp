#pragma once
#include <warden/schema/run_checkpoint.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace warden::checkpoint {

/// The store cannot read or write durable state. Fatal for a run.
class store_unavailable_error final : public std::runtime_error {
 public:
  explicit store_unavailable_error(const std::string& message)
      : std::runtime_error{message} {}
};

/// Durable home of run checkpoints, one per source key.
///
/// `save` is atomic and durable: once it returns, the checkpoint survives a
/// crash and a concurrent `load` sees either the old or the new checkpoint.
/// Saving the same checkpoint twice is a no-op. All methods throw
/// store_unavailable_error on storage faults.
class checkpoint_store {
 public:
  virtual ~checkpoint_store() = default;

  /// The persisted checkpoint, or an empty one for an unknown key.
  virtual warden::schema::run_checkpoint_t load(
      std::string_view source_key) = 0;

  virtual void save(std::string_view source_key,
                    const warden::schema::run_checkpoint_t& checkpoint) = 0;

  virtual std::vector<std::string> list_source_keys() = 0;

  /// Flush anything the backend buffers.
  virtual void persist() = 0;
};

/// Empty checkpoint for `source_key`.
warden::schema::run_checkpoint_t make_checkpoint(std::string_view source_key);

/// Drop in-flight entries whose id is also completed. Returns the ids
/// removed.
std::vector<std::string> repair(warden::schema::run_checkpoint_t& checkpoint);

}  // namespace warden::checkpoint
