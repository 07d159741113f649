#pragma once
#include <warden/collaborators/decision_engine.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace warden::adapters {

/// Decision engine backed by verdict files written by an external engine.
///
/// Every `*.verdicts` file under the directory is searched, in file name
/// order, for a line `item_id<TAB>verdict<TAB>confidence<TAB>strategy<TAB>
/// rationale`. No line for the item, or a malformed one, is a permanent
/// error.
class verdict_file_engine final
    : public warden::collaborators::decision_engine {
 public:
  explicit verdict_file_engine(std::filesystem::path directory);

  warden::schema::outcome_t<warden::schema::decision_t> decide(
      const warden::schema::pending_item_t& item) override;

 private:
  std::filesystem::path directory_;
};

/// Parse one verdict line. nullopt when malformed.
std::optional<warden::schema::decision_t> parse_verdict_line(
    std::string_view line);

}  // namespace warden::adapters
