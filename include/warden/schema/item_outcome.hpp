#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: item outcome and phase.
// Terminal states of the per-item state machine, plus the pipeline phase an
// in-flight item last reached (used for recovery and error reports).
namespace warden::schema {

enum class item_outcome_t : uint8_t {
  submitted = 0,
  skipped = 1,
  simulated = 2,
  failed = 3
};

enum class item_phase_t : uint8_t {
  filtering = 0,
  deciding = 1,
  submitting = 2,
  attesting = 3,
  recovery = 4,
  feed = 5,
  checkpoint = 6
};

inline constexpr auto kItemOutcomeMappings =
    enum_mappings_t<item_outcome_t, 4>{
        std::pair<std::string_view, item_outcome_t>{"submitted",
                                                    item_outcome_t::submitted},
        std::pair<std::string_view, item_outcome_t>{"skipped",
                                                    item_outcome_t::skipped},
        std::pair<std::string_view, item_outcome_t>{"simulated",
                                                    item_outcome_t::simulated},
        std::pair<std::string_view, item_outcome_t>{"failed",
                                                    item_outcome_t::failed}};

inline constexpr auto kItemPhaseMappings = enum_mappings_t<item_phase_t, 7>{
    std::pair<std::string_view, item_phase_t>{"filtering",
                                              item_phase_t::filtering},
    std::pair<std::string_view, item_phase_t>{"deciding",
                                              item_phase_t::deciding},
    std::pair<std::string_view, item_phase_t>{"submitting",
                                              item_phase_t::submitting},
    std::pair<std::string_view, item_phase_t>{"attesting",
                                              item_phase_t::attesting},
    std::pair<std::string_view, item_phase_t>{"recovery",
                                              item_phase_t::recovery},
    std::pair<std::string_view, item_phase_t>{"feed", item_phase_t::feed},
    std::pair<std::string_view, item_phase_t>{"checkpoint",
                                              item_phase_t::checkpoint}};

inline constexpr std::string_view to_string(const item_outcome_t value) {
  return name_of(value, kItemOutcomeMappings);
}

inline constexpr std::string_view to_string(const item_phase_t value) {
  return name_of(value, kItemPhaseMappings);
}

}  // namespace warden::schema
