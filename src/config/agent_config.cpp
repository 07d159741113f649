#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <warden/config/agent_config.hpp>

#include <fstream>
#include <sstream>

namespace warden::config {

namespace {

namespace po = boost::program_options;

po::options_description make_description() {
  auto options = po::options_description{"warden options"};
  options.add_options()("help,h", "show help")(
      "config,c", po::value<std::string>(), "INI-style configuration file")(
      "db-path", po::value<std::string>()->default_value("warden.db"),
      "RocksDB directory for checkpoints and the submission journal")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value(""),
      "also log to this file")(
      "source-key", po::value<std::vector<std::string>>()->composing(),
      "source key to process (repeatable)")(
      "feed-dir", po::value<std::string>()->default_value("feeds"),
      "directory of <source-key>.feed files")(
      "verdict-dir", po::value<std::string>()->default_value("verdicts"),
      "directory of *.verdicts files")(
      "confidence-threshold", po::value<double>()->default_value(0.7),
      "skip decisions below this confidence")(
      "max-items-per-run", po::value<uint32_t>()->default_value(3),
      "items decided per run and source key")(
      "allow-origin", po::value<std::vector<std::string>>()->composing(),
      "only process items from these origins (repeatable)")(
      "deny-origin", po::value<std::vector<std::string>>()->composing(),
      "never process items from these origins (repeatable)")(
      "dry-run", po::bool_switch(), "decide without submitting or attesting")(
      "run-interval-seconds", po::value<uint64_t>()->default_value(300),
      "delay between passes")(
      "shutdown-grace-seconds", po::value<uint64_t>()->default_value(30),
      "how long shutdown waits for in-progress work")(
      "retry-attempts", po::value<uint32_t>()->default_value(3),
      "attempts per transient collaborator failure")(
      "retry-backoff-ms", po::value<uint64_t>()->default_value(250),
      "first retry delay")(
      "retry-backoff-max-ms", po::value<uint64_t>()->default_value(4000),
      "retry delay cap")(
      "signing-key-file", po::value<std::string>(),
      "file holding the hex secp256k1 attestation key")(
      "chain-id", po::value<uint64_t>()->default_value(8453),
      "EIP-712 domain chain id")(
      "verifying-contract", po::value<std::string>(),
      "attestation proxy address")(
      "schema-uid", po::value<std::string>(), "attestation schema id")(
      "recipient", po::value<std::string>(), "attestation recipient address")(
      "attestation-ttl-seconds", po::value<uint64_t>()->default_value(3600),
      "signature deadline offset")(
      "max-attestation-attempts", po::value<uint32_t>()->default_value(5),
      "attestation attempts per item, 0 for unlimited")(
      "controller", po::value<std::string>(),
      "ledger counter controller address")(
      "submitter", po::value<std::string>(),
      "address forwarding attestations to the ledger counter")(
      "require-active-signer", po::bool_switch(),
      "refuse to forward while the submitter is inactive")(
      "once", po::bool_switch(), "run a single pass and exit");
  return options;
}

template <typename T>
T get(const po::variables_map& vm, const char* name) {
  return vm[name].as<T>();
}

std::vector<std::string> get_list(const po::variables_map& vm,
                                  const char* name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

parse_result_t failure(std::string error) {
  return parse_result_t{.config = std::nullopt, .error = std::move(error)};
}

bool known_log_level(const std::string& level) {
  return level == "off" ||
         spdlog::level::from_str(level) != spdlog::level::off;
}

std::optional<std::string> read_optional_address(
    const po::variables_map& vm,
    const char* name,
    std::optional<warden::schema::address_t>& target) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  auto address = warden::schema::try_make_address(get<std::string>(vm, name));
  if (!address || warden::schema::is_zero(*address)) {
    return std::string{"--"} + name + " must be a non-zero 20-byte hex address";
  }
  target = *address;
  return std::nullopt;
}

std::optional<std::string> read_addresses(const po::variables_map& vm,
                                          agent_config_t& config) {
  if (!vm.contains("verifying-contract")) {
    return "--verifying-contract is required";
  }
  auto contract = warden::schema::try_make_address(
      get<std::string>(vm, "verifying-contract"));
  if (!contract || warden::schema::is_zero(*contract)) {
    return "--verifying-contract must be a non-zero 20-byte hex address";
  }
  config.verifying_contract = *contract;

  if (!vm.contains("schema-uid")) {
    return "--schema-uid is required";
  }
  auto schema =
      warden::schema::try_make_hash32(get<std::string>(vm, "schema-uid"));
  if (!schema) {
    return "--schema-uid must be 32 hex-encoded bytes";
  }
  config.schema_uid = *schema;

  if (vm.contains("recipient")) {
    auto recipient =
        warden::schema::try_make_address(get<std::string>(vm, "recipient"));
    if (!recipient) {
      return "--recipient must be a 20-byte hex address";
    }
    config.recipient = *recipient;
  }
  if (auto error =
          read_optional_address(vm, "controller", config.controller)) {
    return error;
  }
  return read_optional_address(vm, "submitter", config.submitter);
}

}  // namespace

parse_result_t parse_arguments(const int argc, const char* const argv[]) {
  auto description = make_description();
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto in = std::ifstream{path};
      if (!in) {
        return failure("--config: cannot open '" + path + "'");
      }
      po::store(po::parse_config_file(in, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    return failure(e.what());
  }

  auto usage = std::ostringstream{};
  usage << description;
  if (vm.contains("help")) {
    return parse_result_t{.config = std::nullopt,
                          .error = {},
                          .help = true,
                          .usage = usage.str()};
  }

  auto config = agent_config_t{};
  config.db_path = get<std::string>(vm, "db-path");
  config.log_level = get<std::string>(vm, "log-level");
  config.log_file = get<std::string>(vm, "log-file");
  config.feed_dir = get<std::string>(vm, "feed-dir");
  config.verdict_dir = get<std::string>(vm, "verdict-dir");
  config.once = get<bool>(vm, "once");

  if (!known_log_level(config.log_level)) {
    return failure("--log-level: unknown level '" + config.log_level + "'");
  }
  if (config.db_path.empty()) {
    return failure("--db-path must not be empty");
  }

  config.source_keys = get_list(vm, "source-key");
  if (config.source_keys.empty()) {
    return failure("--source-key is required");
  }
  for (const auto& key : config.source_keys) {
    if (key.empty()) {
      return failure("--source-key must not be empty");
    }
  }

  auto& run = config.run;
  run.confidence_threshold = get<double>(vm, "confidence-threshold");
  if (!(run.confidence_threshold >= 0.0 && run.confidence_threshold <= 1.0)) {
    return failure("--confidence-threshold must be within [0, 1]");
  }
  run.max_items_per_run = get<uint32_t>(vm, "max-items-per-run");
  if (run.max_items_per_run == 0) {
    return failure("--max-items-per-run must be at least 1");
  }
  for (auto& origin : get_list(vm, "allow-origin")) {
    run.origins.allow.insert(std::move(origin));
  }
  for (auto& origin : get_list(vm, "deny-origin")) {
    run.origins.deny.insert(std::move(origin));
  }
  run.dry_run = get<bool>(vm, "dry-run");
  run.retry.attempts = get<uint32_t>(vm, "retry-attempts");
  if (run.retry.attempts == 0) {
    return failure("--retry-attempts must be at least 1");
  }
  run.retry.backoff =
      std::chrono::milliseconds{get<uint64_t>(vm, "retry-backoff-ms")};
  run.retry.max_backoff =
      std::chrono::milliseconds{get<uint64_t>(vm, "retry-backoff-max-ms")};
  if (run.retry.max_backoff < run.retry.backoff) {
    return failure(
        "--retry-backoff-max-ms must not be below --retry-backoff-ms");
  }
  run.max_attestation_attempts = get<uint32_t>(vm, "max-attestation-attempts");

  config.run_interval =
      std::chrono::seconds{get<uint64_t>(vm, "run-interval-seconds")};
  if (config.run_interval.count() == 0) {
    return failure("--run-interval-seconds must be at least 1");
  }
  config.shutdown_grace =
      std::chrono::seconds{get<uint64_t>(vm, "shutdown-grace-seconds")};

  if (!vm.contains("signing-key-file")) {
    return failure("--signing-key-file is required");
  }
  config.signing_key_file = get<std::string>(vm, "signing-key-file");
  config.chain_id = get<uint64_t>(vm, "chain-id");
  if (config.chain_id == 0) {
    return failure("--chain-id must be non-zero");
  }
  config.attestation_ttl_seconds = get<uint64_t>(vm, "attestation-ttl-seconds");
  if (config.attestation_ttl_seconds == 0) {
    return failure("--attestation-ttl-seconds must be at least 1");
  }
  config.require_active_signer = get<bool>(vm, "require-active-signer");

  if (auto error = read_addresses(vm, config)) {
    return failure(*error);
  }

  return parse_result_t{.config = std::move(config),
                        .error = {},
                        .help = false,
                        .usage = usage.str()};
}

}  // namespace warden::config
