#pragma once
#include <warden/schema/verdict.hpp>

#include <cstdint>
#include <string>

namespace warden::schema {

/// Decision engine output for one item. Never mutated after construction.
struct decision final {
  std::string item_id;
  verdict_t verdict{verdict_t::no_action};
  double confidence{};
  std::string rationale;
  std::string strategy_applied;
};

using decision_t = decision;

/// Confidence in basis points (0..10000), the unit persisted and signed.
uint32_t confidence_bps(double confidence);
double confidence_from_bps(uint32_t bps);

}  // namespace warden::schema
