#pragma once
#include <warden/schema/collaborator_error.hpp>
#include <warden/schema/decision.hpp>
#include <warden/schema/pending_item.hpp>

namespace warden::collaborators {

/// Produces a verdict for one item. Must not mutate external state.
class decision_engine {
 public:
  virtual ~decision_engine() = default;

  virtual warden::schema::outcome_t<warden::schema::decision_t> decide(
      const warden::schema::pending_item_t& item) = 0;
};

}  // namespace warden::collaborators
