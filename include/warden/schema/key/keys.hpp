#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

// RocksDB key layout. Every family is a fixed ASCII prefix followed by
// '|'-separated components.
namespace warden::schema::key {

inline constexpr auto kCheckpointPrefix = std::string_view{"CHECKPOINT|"};
inline constexpr auto kCheckpointBackupPrefix =
    std::string_view{"CHECKPOINT_BACKUP|"};
inline constexpr auto kSubmissionPrefix = std::string_view{"SUBMISSION|"};

bytes_t make_checkpoint_key(std::string_view source_key);

/// Prefix shared by every backup of one source key.
bytes_t make_checkpoint_backup_prefix(std::string_view source_key);
bytes_t make_checkpoint_backup_key(std::string_view source_key,
                                   uint64_t sequence);

bytes_t make_submission_key(std::string_view source_key,
                            std::string_view item_id);

}  // namespace warden::schema::key
