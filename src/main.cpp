#include <spdlog/spdlog.h>
#include <warden/adapters/file_proposal_source.hpp>
#include <warden/adapters/journal_execution_surface.hpp>
#include <warden/adapters/verdict_file_engine.hpp>
#include <warden/attestation/signer.hpp>
#include <warden/checkpoint/participant.hpp>
#include <warden/checkpoint/rocksdb_store.hpp>
#include <warden/common/logging.hpp>
#include <warden/config/agent_config.hpp>
#include <warden/crypto/signing_key.hpp>
#include <warden/ledger/eip712_proxy.hpp>
#include <warden/ledger/ledger_counter.hpp>
#include <warden/ledger/ledger_writer.hpp>
#include <warden/run/coordinator.hpp>
#include <warden/run/scheduler.hpp>
#include <warden/shutdown/coordinator.hpp>
#include <warden/shutdown/signals.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

std::optional<warden::crypto::signing_key> load_signing_key(
    const std::string& path) {
  auto in = std::ifstream{path};
  if (!in) {
    spdlog::error("cannot open signing key file '{}'", path);
    return std::nullopt;
  }
  auto contents = std::string{std::istreambuf_iterator<char>{in},
                              std::istreambuf_iterator<char>{}};
  auto key = warden::crypto::signing_key::from_hex(contents);
  if (!key) {
    spdlog::error("signing key file '{}' does not hold a valid secp256k1 key",
                  path);
  }
  return key;
}

uint64_t system_clock_seconds() {
  return warden::run::system_clock_milliseconds() / 1000;
}

void log_report(const warden::shutdown::shutdown_report_t& report) {
  for (const auto& step : report.steps) {
    if (!step.ok) {
      spdlog::warn("shutdown {} {} failed: {}", step.participant, step.step,
                   step.message);
    }
  }
  if (report.timed_out) {
    spdlog::warn("shutdown grace period elapsed with work still in progress");
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  warden::shutdown::install_signal_handlers();

  auto parsed = warden::config::parse_arguments(argc, argv);
  if (parsed.help) {
    std::cout << parsed.usage << std::endl;
    return 0;
  }
  if (!parsed.config) {
    std::cerr << "warden: " << parsed.error << std::endl;
    return 2;
  }
  const auto& config = *parsed.config;

  warden::common::configure_logging(config.log_level, config.log_file);

  auto key = load_signing_key(config.signing_key_file);
  if (!key) {
    spdlog::shutdown();
    return 1;
  }
  const auto signer_address = key->address();

  auto database = std::optional<warden::storage::rocksdb_storage_t>{};
  try {
    database.emplace(
        warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
            config.db_path));
  } catch (const warden::storage::storage_error& e) {
    spdlog::error("cannot open database '{}': {}", config.db_path, e.what());
    spdlog::shutdown();
    return 1;
  }

  auto store = warden::checkpoint::rocksdb_store{*database};
  auto source = warden::adapters::file_proposal_source{config.feed_dir};
  auto engine = warden::adapters::verdict_file_engine{config.verdict_dir};
  auto execution = warden::adapters::journal_execution_surface{*database};

  auto proxy = std::make_shared<warden::ledger::eip712_proxy>(
      config.verifying_contract, config.chain_id, &system_clock_seconds);
  proxy->register_schema(config.schema_uid);

  const auto controller = config.controller.value_or(signer_address);
  const auto submitter = config.submitter.value_or(signer_address);
  auto counter = warden::ledger::ledger_counter{controller, proxy};
  counter.set_active(controller, submitter, true);
  auto writer = warden::ledger::counter_writer{counter, submitter,
                                               config.require_active_signer};

  auto signer = warden::attestation::attestation_signer{
      *key, warden::attestation::signer_config_t{
                .chain_id = config.chain_id,
                .verifying_contract = config.verifying_contract,
                .schema = config.schema_uid,
                .recipient = config.recipient,
                .ttl_seconds = config.attestation_ttl_seconds}};
  key.reset();

  spdlog::info("attesting as {} on chain {} via {}",
               warden::schema::to_hex(signer_address), config.chain_id,
               warden::schema::to_hex(config.verifying_contract));
  if (config.run.dry_run) {
    spdlog::info("dry run: decisions are not submitted or attested");
  }

  auto coordinator = warden::run::run_coordinator{
      config.run, warden::run::dependencies_t{.store = store,
                                              .source = source,
                                              .engine = engine,
                                              .execution = execution,
                                              .signer = signer,
                                              .ledger = writer}};
  auto scheduler = warden::run::scheduler{
      coordinator, config.source_keys,
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config.run_interval)};
  auto store_participant = warden::checkpoint::store_participant{store};

  auto shutdown = warden::shutdown::coordinator{
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config.shutdown_grace)};
  shutdown.register_participant("scheduler", scheduler);
  shutdown.register_participant("run-coordinator", coordinator);
  shutdown.register_participant("checkpoint-store", store_participant);

  auto finished = std::atomic<bool>{false};
  auto watcher = std::thread{[&]() {
    while (!finished) {
      if (warden::shutdown::wait_for_termination(
              std::chrono::milliseconds{200})) {
        spdlog::info("termination requested, shutting down");
        log_report(shutdown.shutdown());
        return;
      }
    }
  }};

  const auto passes = scheduler.run(config.once);
  finished = true;
  watcher.join();

  log_report(shutdown.shutdown());
  spdlog::info("stopped after {} pass(es)", passes);
  spdlog::shutdown();
  return 0;
}
