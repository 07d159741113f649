#pragma once
#include <warden/run/run_config.hpp>
#include <warden/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

/// Validated daemon configuration.
struct agent_config final {
  std::string db_path{"warden.db"};
  std::string log_level{"info"};
  std::string log_file;

  std::vector<std::string> source_keys;
  std::string feed_dir{"feeds"};
  std::string verdict_dir{"verdicts"};

  warden::run::run_config_t run;
  std::chrono::seconds run_interval{300};
  std::chrono::seconds shutdown_grace{30};
  bool once{false};

  std::string signing_key_file;
  uint64_t chain_id{8453};
  warden::schema::address_t verifying_contract{};
  warden::schema::hash32_t schema_uid{};
  warden::schema::address_t recipient{};
  uint64_t attestation_ttl_seconds{3600};

  /// Unset means the signer's own address.
  std::optional<warden::schema::address_t> controller;
  std::optional<warden::schema::address_t> submitter;
  bool require_active_signer{false};
};

using agent_config_t = agent_config;

struct parse_result final {
  std::optional<agent_config_t> config;
  /// Names the offending option.
  std::string error;
  bool help{false};
  std::string usage;
};

using parse_result_t = parse_result;

/// Command line first, then the `--config` file for anything not given on
/// the command line.
parse_result_t parse_arguments(int argc, const char* const argv[]);

}  // namespace warden::config
