#pragma once

#include <string>
#include <utility>

namespace warden::common {

/// Success or a human-readable failure reason.
struct status final {
  bool ok{true};
  std::string message;

  static status success() { return status{}; }
  static status failure(std::string reason) {
    return status{.ok = false, .message = std::move(reason)};
  }

  explicit operator bool() const { return ok; }
};

}  // namespace warden::common
