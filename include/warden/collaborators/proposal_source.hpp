#pragma once
#include <warden/schema/collaborator_error.hpp>
#include <warden/schema/pending_item.hpp>

#include <string_view>
#include <vector>

namespace warden::collaborators {

/// Feed of items awaiting a decision.
class proposal_source {
 public:
  virtual ~proposal_source() = default;

  /// Items in feed order. May return a partial page. Repeated calls for the
  /// same key within a short window return the same items.
  virtual warden::schema::outcome_t<std::vector<warden::schema::pending_item_t>>
  list_pending(std::string_view source_key) = 0;
};

}  // namespace warden::collaborators
