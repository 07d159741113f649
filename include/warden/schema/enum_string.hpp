#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace warden::schema {

/// Name table for an enum that is logged, persisted or parsed by name.
template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view name,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& entry : mappings) {
    if (entry.first == name) {
      return entry.second;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& entry : mappings) {
    if (entry.second == value) {
      return entry.first;
    }
  }
  return std::nullopt;
}

/// "unknown" for values missing from the table, e.g. read from a newer
/// checkpoint.
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_mappings_t<Enum, N>& mappings) {
  return to_string(value, mappings).value_or("unknown");
}

/// Specialised next to each enum that can be parsed.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view name);

}  // namespace warden::schema
