#pragma once
#include <warden/schema/pending_item.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace warden::run {

struct origin_rules final {
  std::set<std::string> allow;
  std::set<std::string> deny;
};

using origin_rules_t = origin_rules;

struct filtered_item final {
  warden::schema::pending_item_t item;
  std::string reason;
};

struct selection final {
  /// Eligible items within the cap, in feed order.
  std::vector<warden::schema::pending_item_t> selected;
  /// Items refused by origin rules.
  std::vector<filtered_item> filtered;
  /// Eligible items left for a later run by the cap.
  std::vector<warden::schema::pending_item_t> deferred;
};

using selection_t = selection;

/// Deny wins over allow; a non-empty allow list admits only its origins.
/// Returns the refusal reason, empty when admitted.
std::string origin_refusal(const origin_rules_t& rules,
                           const std::string& origin);

/// Origin filtering first, then the first `max_items` survivors.
selection_t select_items(
    const std::vector<warden::schema::pending_item_t>& items,
    const origin_rules_t& rules,
    uint32_t max_items);

}  // namespace warden::run
