#include <warden/run/item_filter.hpp>

namespace warden::run {

std::string origin_refusal(const origin_rules_t& rules,
                           const std::string& origin) {
  if (rules.deny.contains(origin)) {
    return "origin '" + origin + "' is denied";
  }
  if (!rules.allow.empty() && !rules.allow.contains(origin)) {
    return "origin '" + origin + "' is not allowed";
  }
  return {};
}

selection_t select_items(
    const std::vector<warden::schema::pending_item_t>& items,
    const origin_rules_t& rules,
    const uint32_t max_items) {
  auto result = selection_t{};
  for (const auto& item : items) {
    auto reason = origin_refusal(rules, item.origin);
    if (!reason.empty()) {
      result.filtered.push_back(
          filtered_item{.item = item, .reason = std::move(reason)});
    } else if (result.selected.size() < max_items) {
      result.selected.push_back(item);
    } else {
      result.deferred.push_back(item);
    }
  }
  return result;
}

}  // namespace warden::run
