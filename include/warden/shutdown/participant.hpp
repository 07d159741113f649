#pragma once
#include <warden/common/status.hpp>

#include <chrono>

namespace warden::shutdown {

/// A subsystem that takes part in the ordered stop sequence.
class participant {
 public:
  virtual ~participant() = default;

  /// Stop accepting new work. Work already started may finish.
  virtual warden::common::status quiesce() = 0;

  /// Flush durable state.
  virtual warden::common::status persist() = 0;

  /// Free resources. Called in reverse registration order.
  virtual warden::common::status release() = 0;

  /// Block until in-progress work reached a checkpoint-safe point. Returns
  /// false if `timeout` elapsed first.
  virtual bool await_idle(std::chrono::milliseconds timeout) {
    static_cast<void>(timeout);
    return true;
  }
};

}  // namespace warden::shutdown
