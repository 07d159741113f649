#pragma once
#include <warden/schema/collaborator_error.hpp>
#include <warden/schema/decision.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace warden::collaborators {

/// Where decisions are acted upon, e.g. where a vote is cast.
class execution_surface {
 public:
  virtual ~execution_surface() = default;

  /// Submit `decision` for `item_id`. Returns an opaque submission reference.
  virtual warden::schema::outcome_t<std::string> submit(
      std::string_view source_key,
      const warden::schema::decision_t& decision) = 0;

  /// Reference of an earlier submission for (`item_id`, `source_key`), if one
  /// happened. Used to reconcile after a crash or an ambiguous failure.
  virtual warden::schema::outcome_t<std::optional<std::string>>
  find_submission(std::string_view item_id, std::string_view source_key) = 0;
};

}  // namespace warden::collaborators
