#include <warden/checkpoint/store.hpp>

namespace warden::checkpoint {

warden::schema::run_checkpoint_t make_checkpoint(
    const std::string_view source_key) {
  auto checkpoint = warden::schema::run_checkpoint_t{};
  checkpoint.source_key = std::string{source_key};
  return checkpoint;
}

std::vector<std::string> repair(warden::schema::run_checkpoint_t& checkpoint) {
  auto removed = std::vector<std::string>{};
  for (auto it = std::begin(checkpoint.in_flight);
       it != std::end(checkpoint.in_flight);) {
    if (checkpoint.completed.contains(it->first)) {
      removed.push_back(it->first);
      it = checkpoint.in_flight.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

}  // namespace warden::checkpoint
