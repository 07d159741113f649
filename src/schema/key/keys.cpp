#include <warden/schema/key/builder.hpp>
#include <warden/schema/key/keys.hpp>

namespace warden::schema::key {

bytes_t make_checkpoint_key(const std::string_view source_key) {
  auto b = builder{};
  b.write(kCheckpointPrefix);
  b.write(source_key);
  return b.data;
}

bytes_t make_checkpoint_backup_prefix(const std::string_view source_key) {
  auto b = builder{};
  b.write(kCheckpointBackupPrefix);
  b.hash(source_key);
  b.write("|");
  return b.data;
}

bytes_t make_checkpoint_backup_key(const std::string_view source_key,
                                   const uint64_t sequence) {
  auto b = builder{};
  b.data = make_checkpoint_backup_prefix(source_key);
  b.write_ordered(sequence);
  return b.data;
}

bytes_t make_submission_key(const std::string_view source_key,
                            const std::string_view item_id) {
  auto b = builder{};
  b.write(kSubmissionPrefix);
  b.hash(source_key);
  b.write("|");
  b.write(item_id);
  return b.data;
}

}  // namespace warden::schema::key
