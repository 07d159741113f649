#include <warden/checkpoint/participant.hpp>

namespace warden::checkpoint {

store_participant::store_participant(checkpoint_store& store)
    : store_{store} {}

warden::common::status store_participant::quiesce() {
  return warden::common::status::success();
}

warden::common::status store_participant::persist() {
  try {
    store_.persist();
  } catch (const store_unavailable_error& e) {
    return warden::common::status::failure(e.what());
  }
  return warden::common::status::success();
}

warden::common::status store_participant::release() {
  return warden::common::status::success();
}

}  // namespace warden::checkpoint
