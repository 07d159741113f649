#include <gtest/gtest.h>
#include <warden/ledger/eip712_proxy.hpp>
#include <warden/ledger/revert_error.hpp>
#include <warden/testing/ledger_fixture.hpp>

#include <string>

namespace {

warden::attestation::attest_request_t make_request(
    const warden::attestation::attestation_signer& signer,
    const uint64_t deadline) {
  auto record = warden::schema::attestation_record_t{
      .signer_address = signer.address(),
      .item_id = "proposal-7",
      .source_key = "spaceA",
      .verdict = warden::schema::verdict_t::reject,
      .decision_digest = warden::testing::make_hash(1),
      .submission_reference = "ref",
      .created_at = 0};
  return signer.build_request(record, deadline);
}

std::string revert_reason(warden::ledger::eip712_proxy& proxy,
                          const warden::attestation::signed_attestation_t& a) {
  try {
    proxy.attest_by_delegation(a.request, a.signature);
  } catch (const warden::ledger::revert_error& e) {
    return std::string{e.reason()};
  }
  return {};
}

}  // namespace

TEST(eip712_proxy, deadline_is_inclusive) {
  auto fixture = warden::testing::ledger_fixture{};
  const auto& signer = fixture.signer();
  auto& proxy = fixture.proxy();
  const auto now = warden::testing::kEpochSeconds;

  EXPECT_EQ(revert_reason(proxy,
                          signer.sign_request(make_request(signer, now - 1))),
            warden::ledger::kDeadlineExpired);
  EXPECT_EQ(
      revert_reason(proxy, signer.sign_request(make_request(signer, now))), "");
  // Zero means no deadline.
  EXPECT_EQ(revert_reason(proxy, signer.sign_request(make_request(signer, 0))),
            "");
  EXPECT_EQ(proxy.size(), 2u);
}

TEST(eip712_proxy, rejects_unregistered_schemas) {
  auto fixture = warden::testing::ledger_fixture{};
  const auto& signer = fixture.signer();
  auto request = make_request(signer, 0);
  request.schema = warden::testing::make_hash(0x55);
  EXPECT_EQ(revert_reason(fixture.proxy(), signer.sign_request(request)),
            warden::ledger::kInvalidSchema);
}

TEST(eip712_proxy, rejects_signatures_for_other_attesters) {
  auto fixture = warden::testing::ledger_fixture{};
  const auto& signer = fixture.signer();
  auto signed_attestation = signer.sign_request(make_request(signer, 0));

  auto impostor = signed_attestation;
  impostor.request.attester = warden::testing::make_address(3);
  EXPECT_EQ(revert_reason(fixture.proxy(), impostor),
            warden::ledger::kInvalidSignature);

  auto tampered = signed_attestation;
  tampered.request.data.push_back(0);
  EXPECT_EQ(revert_reason(fixture.proxy(), tampered),
            warden::ledger::kInvalidSignature);
}

TEST(eip712_proxy, rejects_other_domains) {
  auto fixture = warden::testing::ledger_fixture{};
  auto config = warden::testing::make_signer_config();
  config.chain_id = 1;
  auto mainnet_signer = warden::attestation::attestation_signer{
      warden::testing::make_signing_key(), config};
  auto signed_attestation =
      mainnet_signer.sign_request(make_request(mainnet_signer, 0));
  EXPECT_EQ(revert_reason(fixture.proxy(), signed_attestation),
            warden::ledger::kInvalidSignature);
}

TEST(eip712_proxy, records_get_distinct_ids) {
  auto fixture = warden::testing::ledger_fixture{};
  const auto& signer = fixture.signer();
  auto signed_attestation = signer.sign_request(make_request(signer, 0));
  auto& proxy = fixture.proxy();

  auto first = proxy.attest_by_delegation(signed_attestation.request,
                                          signed_attestation.signature);
  auto second = proxy.attest_by_delegation(signed_attestation.request,
                                           signed_attestation.signature);
  EXPECT_NE(first, second);
  ASSERT_TRUE(proxy.find(first).has_value());
  EXPECT_EQ(proxy.find(first)->request.attester, signer.address());
  EXPECT_FALSE(proxy.find(warden::testing::make_hash(0)).has_value());
}
