#pragma once
#include <warden/checkpoint/store.hpp>
#include <warden/shutdown/participant.hpp>

namespace warden::checkpoint {

/// Shutdown participant that flushes a checkpoint store.
class store_participant final : public warden::shutdown::participant {
 public:
  explicit store_participant(checkpoint_store& store);

  warden::common::status quiesce() override;
  warden::common::status persist() override;
  warden::common::status release() override;

 private:
  checkpoint_store& store_;
};

}  // namespace warden::checkpoint
