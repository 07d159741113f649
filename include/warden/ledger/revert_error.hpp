#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace warden::ledger {

inline constexpr auto kInvalidSignature = std::string_view{"InvalidSignature"};
inline constexpr auto kDeadlineExpired = std::string_view{"DeadlineExpired"};
inline constexpr auto kInvalidSchema = std::string_view{"InvalidSchema"};
inline constexpr auto kCounterOverflow = std::string_view{"CounterOverflow"};
inline constexpr auto kUnauthorized = std::string_view{"Unauthorized"};
inline constexpr auto kZeroAddress = std::string_view{"ZeroAddress"};
inline constexpr auto kSignerInactive = std::string_view{"SignerInactive"};

/// A reverted contract call. State touched by the call has been rolled back
/// by the time this propagates; `reason()` is the revert reason unmodified.
class revert_error final : public std::runtime_error {
 public:
  explicit revert_error(std::string_view reason)
      : std::runtime_error{std::string{reason}} {}

  std::string_view reason() const { return what(); }
};

}  // namespace warden::ledger
