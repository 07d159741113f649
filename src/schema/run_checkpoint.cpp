#include <warden/schema/run_checkpoint.hpp>

namespace warden::schema {

std::set<std::string> in_flight_item_ids(const run_checkpoint_t& checkpoint) {
  auto ids = std::set<std::string>{};
  for (const auto& [id, entry] : checkpoint.in_flight) {
    ids.insert(id);
  }
  return ids;
}

std::set<std::string> completed_item_ids(const run_checkpoint_t& checkpoint) {
  auto ids = std::set<std::string>{};
  for (const auto& [id, entry] : checkpoint.completed) {
    ids.insert(id);
  }
  return ids;
}

bool unclean_shutdown(const run_checkpoint_t& checkpoint) {
  return checkpoint.last_run_started_at > checkpoint.last_run_finished_at;
}

bool disjoint(const run_checkpoint_t& checkpoint) {
  for (const auto& [id, entry] : checkpoint.in_flight) {
    if (checkpoint.completed.contains(id)) {
      return false;
    }
  }
  return true;
}

}  // namespace warden::schema
