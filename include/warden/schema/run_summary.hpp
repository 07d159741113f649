#pragma once
#include <warden/schema/enum_string.hpp>
#include <warden/schema/item_outcome.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace warden::schema {

/// How one item ended up in this run, as reported to operators.
enum class report_status_t : uint8_t {
  submitted = 0,
  skipped = 1,
  simulated = 2,
  failed = 3,
  pending_recovery = 4
};

inline constexpr auto kReportStatusMappings =
    enum_mappings_t<report_status_t, 5>{
        std::pair<std::string_view, report_status_t>{
            "submitted", report_status_t::submitted},
        std::pair<std::string_view, report_status_t>{"skipped",
                                                     report_status_t::skipped},
        std::pair<std::string_view, report_status_t>{
            "simulated", report_status_t::simulated},
        std::pair<std::string_view, report_status_t>{"failed",
                                                     report_status_t::failed},
        std::pair<std::string_view, report_status_t>{
            "pending_recovery", report_status_t::pending_recovery}};

inline constexpr std::string_view to_string(const report_status_t value) {
  return name_of(value, kReportStatusMappings);
}

struct item_report final {
  std::string item_id;
  report_status_t status{report_status_t::failed};
  item_phase_t phase{item_phase_t::deciding};
  std::string reason;
};

/// Aggregate of one `run()` call. `errors` holds the failed and
/// pending-recovery subset of `items`.
struct run_summary final {
  std::string source_key;
  uint32_t decided{};
  uint32_t submitted{};
  uint32_t skipped{};
  uint32_t simulated{};
  uint32_t failed{};
  uint32_t recovered{};
  uint32_t pending_recovery{};
  /// Eligible items left for a later run by the per-run cap.
  uint32_t deferred{};
  bool unclean_shutdown_detected{false};
  bool interrupted{false};
  std::vector<item_report> items;
  std::vector<item_report> errors;
};

using run_summary_t = run_summary;

}  // namespace warden::schema
