#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: verdict.
// Decision outcome for one item. Numeric values follow ballot choice
// numbering and are the values committed into attestation payloads.
namespace warden::schema {

enum class verdict_t : uint8_t {
  no_action = 0,
  approve = 1,
  reject = 2,
  abstain = 3
};

inline constexpr auto kVerdictMappings = enum_mappings_t<verdict_t, 4>{
    std::pair<std::string_view, verdict_t>{"no_action", verdict_t::no_action},
    std::pair<std::string_view, verdict_t>{"approve", verdict_t::approve},
    std::pair<std::string_view, verdict_t>{"reject", verdict_t::reject},
    std::pair<std::string_view, verdict_t>{"abstain", verdict_t::abstain}};

template <>
inline std::optional<verdict_t> try_from_string<verdict_t>(
    const std::string_view value) {
  return from_string(value, kVerdictMappings);
}

inline constexpr std::string_view to_string(const verdict_t value) {
  return name_of(value, kVerdictMappings);
}

/// Only `no_action` is non-actionable; reject and abstain are still submitted.
inline constexpr bool is_actionable(const verdict_t value) {
  return value != verdict_t::no_action;
}

}  // namespace warden::schema
