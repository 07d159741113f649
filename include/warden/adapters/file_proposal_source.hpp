#pragma once
#include <warden/collaborators/proposal_source.hpp>

#include <filesystem>

namespace warden::adapters {

/// Reads `<directory>/<source_key>.feed`.
///
/// One item per line, `item_id<TAB>origin<TAB>payload`. Blank lines and lines
/// starting with '#' are ignored; a repeated item id keeps its first line. A
/// missing feed file is a permanent error.
class file_proposal_source final
    : public warden::collaborators::proposal_source {
 public:
  explicit file_proposal_source(std::filesystem::path directory);

  warden::schema::outcome_t<std::vector<warden::schema::pending_item_t>>
  list_pending(std::string_view source_key) override;

 private:
  std::filesystem::path directory_;
};

/// True for keys usable as a single file name component.
bool valid_source_key(std::string_view source_key);

}  // namespace warden::adapters
