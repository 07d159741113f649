#pragma once
#include <warden/run/item_filter.hpp>
#include <warden/run/retry.hpp>

#include <cstdint>

namespace warden::run {

struct run_config final {
  /// Decisions with confidence strictly below this are skipped.
  double confidence_threshold{0.7};
  uint32_t max_items_per_run{3};
  origin_rules_t origins;
  /// Decide but never submit or attest.
  bool dry_run{false};
  retry_policy_t retry;
  /// Total attestation attempts per item before giving up; 0 = unlimited.
  uint32_t max_attestation_attempts{5};
};

using run_config_t = run_config;

}  // namespace warden::run
