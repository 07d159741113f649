#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace warden::schema {

/// Error classes a collaborator can report.
///
/// `transient` failures (network, timeout) are retried with bounded backoff
/// at the call site. `permanent` failures are final for the item.
/// `rejected` is a protocol-level refusal (signature, deadline, schema) and
/// carries the ledger's reason unmodified.
enum class error_kind_t : uint8_t {
  transient = 0,
  permanent = 1,
  rejected = 2
};

inline constexpr auto kErrorKindMappings = enum_mappings_t<error_kind_t, 3>{
    std::pair<std::string_view, error_kind_t>{"transient",
                                              error_kind_t::transient},
    std::pair<std::string_view, error_kind_t>{"permanent",
                                              error_kind_t::permanent},
    std::pair<std::string_view, error_kind_t>{"rejected",
                                              error_kind_t::rejected}};

inline constexpr std::string_view to_string(const error_kind_t value) {
  return name_of(value, kErrorKindMappings);
}

struct collaborator_error final {
  error_kind_t kind{error_kind_t::permanent};
  std::string reason;
};

using collaborator_error_t = collaborator_error;

/// Explicit outcome of a collaborator call.
template <typename T>
using outcome_t = std::variant<T, collaborator_error_t>;

template <typename T>
bool succeeded(const outcome_t<T>& outcome) {
  return std::holds_alternative<T>(outcome);
}

inline collaborator_error_t transient_error(std::string reason) {
  return collaborator_error_t{.kind = error_kind_t::transient,
                              .reason = std::move(reason)};
}

inline collaborator_error_t permanent_error(std::string reason) {
  return collaborator_error_t{.kind = error_kind_t::permanent,
                              .reason = std::move(reason)};
}

inline collaborator_error_t rejected_error(std::string reason) {
  return collaborator_error_t{.kind = error_kind_t::rejected,
                              .reason = std::move(reason)};
}

}  // namespace warden::schema
