#include <boost/program_options.hpp>
#include <warden/attestation/payload.hpp>
#include <warden/attestation/signer.hpp>
#include <warden/common/critical.hpp>
#include <warden/crypto/signing_key.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/eip712/typed_data.hpp>
#include <warden/schema/decision.hpp>

#include <cstdint>
#include <iostream>
#include <string>

namespace {

namespace po = boost::program_options;

std::string require(const po::variables_map& vm, const char* name) {
  if (!vm.contains(name)) {
    warden::common::critical("missing --{}", name);
  }
  return vm[name].as<std::string>();
}

warden::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const char* name) {
  auto value = warden::schema::try_make_hash32(require(vm, name));
  if (!value) {
    warden::common::critical("--{} must be 32 hex-encoded bytes", name);
  }
  return *value;
}

warden::schema::address_t get_address(const po::variables_map& vm,
                                      const char* name) {
  auto value = warden::schema::try_make_address(require(vm, name));
  if (!value) {
    warden::common::critical("--{} must be a 20-byte hex address", name);
  }
  return *value;
}

warden::crypto::signing_key get_key(const po::variables_map& vm) {
  auto key = warden::crypto::signing_key::from_hex(require(vm, "key"));
  if (!key) {
    warden::common::critical("--key is not a valid secp256k1 secret");
  }
  return *key;
}

warden::schema::decision_t make_decision(const po::variables_map& vm) {
  auto verdict = warden::schema::try_from_string<warden::schema::verdict_t>(
      require(vm, "verdict"));
  if (!verdict) {
    warden::common::critical("--verdict must be approve|reject|abstain");
  }
  auto confidence = vm["confidence"].as<double>();
  if (!(confidence >= 0.0 && confidence <= 1.0)) {
    warden::common::critical("--confidence must be within [0, 1]");
  }
  return warden::schema::decision_t{
      .item_id = require(vm, "item-id"),
      .verdict = *verdict,
      .confidence = confidence,
      .rationale = vm["rationale"].as<std::string>(),
      .strategy_applied = vm["strategy"].as<std::string>()};
}

warden::schema::attestation_record_t make_record(
    const po::variables_map& vm,
    const warden::schema::address_t& signer) {
  auto decision = make_decision(vm);
  return warden::schema::attestation_record_t{
      .signer_address = signer,
      .item_id = decision.item_id,
      .source_key = require(vm, "source-key"),
      .verdict = decision.verdict,
      .decision_digest = warden::attestation::decision_digest(decision),
      .submission_reference = require(vm, "submission-reference"),
      .created_at = 0};
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  warden-attest address --key <hex>\n"
            << "  warden-attest payload [decision options]\n"
            << "  warden-attest sign [decision and domain options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"warden-attest options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "address|payload|sign")(
      "key", po::value<std::string>(), "secp256k1 secret hex")(
      "item-id", po::value<std::string>(), "decided item id")(
      "source-key", po::value<std::string>(), "source key of the item")(
      "verdict", po::value<std::string>(), "approve|reject|abstain")(
      "confidence", po::value<double>()->default_value(1.0),
      "decision confidence in [0, 1]")(
      "rationale", po::value<std::string>()->default_value(""),
      "decision rationale")(
      "strategy", po::value<std::string>()->default_value(""),
      "strategy applied")("submission-reference", po::value<std::string>(),
                          "reference returned by the execution surface")(
      "chain-id", po::value<uint64_t>()->default_value(8453),
      "EIP-712 domain chain id")("verifying-contract",
                                 po::value<std::string>(),
                                 "attestation proxy address")(
      "schema-uid", po::value<std::string>(), "attestation schema id")(
      "recipient", po::value<std::string>()->default_value(
                       "0x0000000000000000000000000000000000000000"),
      "attestation recipient")("deadline", po::value<uint64_t>(),
                               "signature deadline, unix seconds");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "address") {
    std::cout << warden::schema::to_hex(get_key(vm).address()) << '\n';
    return 0;
  }

  if (command == "payload") {
    auto decision = make_decision(vm);
    auto record = make_record(vm, warden::schema::address_t{});
    std::cout << "decision_digest "
              << warden::schema::to_hex(
                     warden::attestation::decision_digest(decision))
              << '\n';
    std::cout << "data "
              << warden::schema::to_hex(
                     warden::attestation::attestation_data(record))
              << '\n';
    return 0;
  }

  if (command == "sign") {
    if (!vm.contains("deadline")) {
      warden::common::critical("sign requires --deadline");
    }
    auto key = get_key(vm);
    auto signer = warden::attestation::attestation_signer{
        key, warden::attestation::signer_config_t{
                 .chain_id = vm["chain-id"].as<uint64_t>(),
                 .verifying_contract = get_address(vm, "verifying-contract"),
                 .schema = get_hash32(vm, "schema-uid"),
                 .recipient = get_address(vm, "recipient")}};
    auto record = make_record(vm, signer.address());
    auto signed_attestation =
        signer.sign(record, vm["deadline"].as<uint64_t>());
    if (!warden::crypto::verify_signature(signed_attestation.digest,
                                          signer.address(),
                                          signed_attestation.signature)) {
      warden::common::critical("produced signature does not verify");
    }
    std::cout << "attester " << warden::schema::to_hex(signer.address())
              << '\n';
    std::cout << "domain_separator "
              << warden::schema::to_hex(
                     warden::eip712::domain_separator(signer.domain()))
              << '\n';
    std::cout << "struct_hash "
              << warden::schema::to_hex(warden::attestation::attest_struct_hash(
                     signed_attestation.request))
              << '\n';
    std::cout << "digest " << warden::schema::to_hex(signed_attestation.digest)
              << '\n';
    std::cout << "data "
              << warden::schema::to_hex(signed_attestation.request.data)
              << '\n';
    std::cout << "signature "
              << warden::schema::to_hex(signed_attestation.signature) << '\n';
    return 0;
  }

  warden::common::critical("unknown command '{}'", command);
}
