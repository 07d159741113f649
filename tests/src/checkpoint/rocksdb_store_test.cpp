#include <gtest/gtest.h>
#include <warden/checkpoint/participant.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/checkpoint/rocksdb_store.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/encoding/scale/run_checkpoint.hpp>
#include <warden/schema/key/keys.hpp>
#include <warden/testing/common.hpp>

#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {

using warden::schema::item_outcome_t;
using warden::schema::item_phase_t;

class rocksdb_store_test : public ::testing::Test {
 protected:
  rocksdb_store_test()
      : directory_{"warden_checkpoint"},
        storage_{warden::storage::make_storage<
            warden::storage::rocksdb_storage_tag>(directory_.path() + "/db")} {
  }

  warden::storage::rocksdb_storage_t& storage() { return storage_; }

  void overwrite(const warden::schema::bytes_t& key,
                 const warden::schema::bytes_t& value) {
    auto batch = warden::storage::write_batch_t{};
    batch.puts.emplace_back(key, value);
    storage_.commit(batch);
  }

 private:
  warden::testing::temp_directory directory_;
  warden::storage::rocksdb_storage_t storage_;
};

warden::schema::run_checkpoint_t sample_checkpoint(const std::string& key,
                                                   const uint64_t started) {
  auto checkpoint = warden::checkpoint::make_checkpoint(key);
  checkpoint.last_run_started_at = started;
  checkpoint.last_run_finished_at = started - 5;
  checkpoint.in_flight.emplace(
      "p-2", warden::schema::in_flight_entry{
                 .item = {.item_id = "p-2",
                          .origin = "forum",
                          .payload = "{\"title\":\"grant\"}"},
                 .phase = item_phase_t::attesting,
                 .decision =
                     warden::schema::decision_t{
                         .item_id = "p-2",
                         .verdict = warden::schema::verdict_t::reject,
                         .confidence = 0.8,
                         .rationale = "over budget",
                         .strategy_applied = "conservative"},
                 .submission_reference = "0xabc",
                 .attestation_attempts = 2});
  checkpoint.completed.emplace(
      "p-1", warden::schema::completed_entry{
                 .item_id = "p-1",
                 .outcome = item_outcome_t::submitted,
                 .phase = item_phase_t::attesting,
                 .reason = "",
                 .submission_reference = "0xdef",
                 .record_id = warden::testing::make_hash(8),
                 .completed_at = 98000});
  checkpoint.completed.emplace(
      "p-0", warden::schema::completed_entry{
                 .item_id = "p-0",
                 .outcome = item_outcome_t::skipped,
                 .phase = item_phase_t::deciding,
                 .reason = "confidence 0.50 below threshold 0.70"});
  return checkpoint;
}

namespace rows = warden::schema::encoding::scale;

using envelope_t = std::tuple<uint16_t,
                              warden::schema::hash32_t,
                              warden::schema::bytes_t>;

template <typename Row>
warden::schema::bytes_t seal(const uint16_t version, const Row& row) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto body = encoder.encode(row);
  auto checksum = warden::blake3::hash(warden::schema::make_bytes_view(body));
  return encoder.encode(envelope_t{version, checksum, std::move(body)});
}

// The same checkpoint as written before completion times existed.
rows::run_checkpoint_row_v1_t version_1_row(
    const warden::schema::run_checkpoint_t& checkpoint) {
  auto current = rows::to_row(checkpoint);
  auto completed = std::vector<rows::completed_row_v1_t>{};
  for (const auto& r : std::get<2>(current)) {
    completed.emplace_back(std::get<0>(r), std::get<1>(r), std::get<2>(r),
                           std::get<3>(r), std::get<4>(r), std::get<5>(r));
  }
  return rows::run_checkpoint_row_v1_t{
      std::get<0>(current), std::get<1>(current), std::move(completed),
      std::get<3>(current), std::get<4>(current)};
}

void expect_same(const warden::schema::run_checkpoint_t& actual,
                 const warden::schema::run_checkpoint_t& expected) {
  EXPECT_EQ(actual.source_key, expected.source_key);
  EXPECT_EQ(actual.last_run_started_at, expected.last_run_started_at);
  EXPECT_EQ(actual.last_run_finished_at, expected.last_run_finished_at);
  EXPECT_EQ(warden::schema::in_flight_item_ids(actual),
            warden::schema::in_flight_item_ids(expected));
  EXPECT_EQ(warden::schema::completed_item_ids(actual),
            warden::schema::completed_item_ids(expected));
  for (const auto& [id, entry] : expected.in_flight) {
    const auto& loaded = actual.in_flight.at(id);
    EXPECT_EQ(loaded.item.origin, entry.item.origin);
    EXPECT_EQ(loaded.item.payload, entry.item.payload);
    EXPECT_EQ(loaded.phase, entry.phase);
    EXPECT_EQ(loaded.submission_reference, entry.submission_reference);
    EXPECT_EQ(loaded.attestation_attempts, entry.attestation_attempts);
    ASSERT_EQ(loaded.decision.has_value(), entry.decision.has_value());
    if (entry.decision) {
      EXPECT_EQ(loaded.decision->verdict, entry.decision->verdict);
      EXPECT_DOUBLE_EQ(loaded.decision->confidence, entry.decision->confidence);
      EXPECT_EQ(loaded.decision->rationale, entry.decision->rationale);
      EXPECT_EQ(loaded.decision->strategy_applied,
                entry.decision->strategy_applied);
    }
  }
  for (const auto& [id, entry] : expected.completed) {
    const auto& loaded = actual.completed.at(id);
    EXPECT_EQ(loaded.outcome, entry.outcome);
    EXPECT_EQ(loaded.phase, entry.phase);
    EXPECT_EQ(loaded.reason, entry.reason);
    EXPECT_EQ(loaded.submission_reference, entry.submission_reference);
    EXPECT_EQ(loaded.record_id, entry.record_id);
    EXPECT_EQ(loaded.completed_at, entry.completed_at);
  }
}

}  // namespace

TEST_F(rocksdb_store_test, unknown_keys_load_empty) {
  auto store = warden::checkpoint::rocksdb_store{storage()};
  auto checkpoint = store.load("spaceZ");
  EXPECT_EQ(checkpoint.source_key, "spaceZ");
  EXPECT_TRUE(checkpoint.in_flight.empty());
  EXPECT_TRUE(checkpoint.completed.empty());
  EXPECT_FALSE(warden::schema::unclean_shutdown(checkpoint));
}

TEST_F(rocksdb_store_test, checkpoints_round_trip) {
  auto store = warden::checkpoint::rocksdb_store{storage()};
  auto checkpoint = sample_checkpoint("spaceA", 1000);
  store.save("spaceA", checkpoint);
  expect_same(store.load("spaceA"), checkpoint);
  EXPECT_TRUE(warden::schema::unclean_shutdown(store.load("spaceA")));

  store.save("spaceB", warden::checkpoint::make_checkpoint("spaceB"));
  EXPECT_EQ(store.list_source_keys(),
            (std::vector<std::string>{"spaceA", "spaceB"}));
}

TEST_F(rocksdb_store_test, identical_saves_do_not_rotate_backups) {
  auto store = warden::checkpoint::rocksdb_store{storage()};
  auto checkpoint = sample_checkpoint("spaceA", 1000);
  store.save("spaceA", checkpoint);
  store.save("spaceA", checkpoint);
  store.save("spaceA", checkpoint);
  EXPECT_EQ(store.backup_count("spaceA"), 0u);

  checkpoint.last_run_finished_at = 2000;
  store.save("spaceA", checkpoint);
  EXPECT_EQ(store.backup_count("spaceA"), 1u);
}

TEST_F(rocksdb_store_test, backups_are_pruned) {
  auto store = warden::checkpoint::rocksdb_store{storage(), 3};
  for (auto i = uint64_t{0}; i < 10; ++i) {
    store.save("spaceA", sample_checkpoint("spaceA", 100 + i));
  }
  EXPECT_EQ(store.backup_count("spaceA"), 3u);
  EXPECT_EQ(store.load("spaceA").last_run_started_at, 109u);

  auto no_backups = warden::checkpoint::rocksdb_store{storage(), 0};
  no_backups.save("spaceB", sample_checkpoint("spaceB", 1));
  no_backups.save("spaceB", sample_checkpoint("spaceB", 2));
  EXPECT_EQ(no_backups.backup_count("spaceB"), 0u);
}

TEST_F(rocksdb_store_test, corrupt_checkpoint_falls_back_to_newest_backup) {
  auto store = warden::checkpoint::rocksdb_store{storage()};
  store.save("spaceA", sample_checkpoint("spaceA", 100));
  store.save("spaceA", sample_checkpoint("spaceA", 200));
  store.save("spaceA", sample_checkpoint("spaceA", 300));

  auto key = warden::schema::key::make_checkpoint_key("spaceA");
  auto envelope = *storage().get_raw(key);
  envelope.back() ^= 0xff;
  overwrite(key, envelope);

  auto restored = store.load("spaceA");
  EXPECT_EQ(restored.last_run_started_at, 200u);
}

TEST_F(rocksdb_store_test, corrupt_checkpoint_without_backups_is_fatal) {
  auto store = warden::checkpoint::rocksdb_store{storage(), 0};
  store.save("spaceA", sample_checkpoint("spaceA", 100));
  overwrite(warden::schema::key::make_checkpoint_key("spaceA"),
            warden::schema::bytes_t{0x01, 0x02});
  EXPECT_THROW(store.load("spaceA"),
               warden::checkpoint::store_unavailable_error);
}

TEST_F(rocksdb_store_test, envelope_rejects_tampering) {
  auto checkpoint = sample_checkpoint("spaceA", 5);
  auto envelope = warden::checkpoint::make_envelope(checkpoint);
  ASSERT_TRUE(warden::checkpoint::open_envelope(
                  warden::schema::make_bytes_view(envelope))
                  .has_value());

  envelope[envelope.size() / 2] ^= 0x01;
  EXPECT_FALSE(warden::checkpoint::open_envelope(
                   warden::schema::make_bytes_view(envelope))
                   .has_value());
  EXPECT_FALSE(warden::checkpoint::open_envelope(
                   warden::schema::bytes_view_t{})
                   .has_value());
}

TEST_F(rocksdb_store_test, version_1_checkpoints_still_load) {
  const auto key = warden::schema::key::make_checkpoint_key("spaceA");
  auto original = sample_checkpoint("spaceA", 100);
  overwrite(key, seal(1, version_1_row(original)));
  auto store = warden::checkpoint::rocksdb_store{storage()};

  auto loaded = store.load("spaceA");

  auto expected = original;
  for (auto& [id, entry] : expected.completed) {
    entry.completed_at = 0;
  }
  expect_same(loaded, expected);

  store.save("spaceA", loaded);
  auto raw = storage().get_raw(key);
  ASSERT_TRUE(raw);
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto envelope =
      encoder.try_decode<envelope_t>(warden::schema::make_bytes_view(*raw));
  ASSERT_TRUE(envelope);
  EXPECT_EQ(std::get<0>(*envelope), warden::schema::run_checkpoint_t::version);
}

TEST_F(rocksdb_store_test, envelope_rejects_unknown_versions) {
  auto checkpoint = sample_checkpoint("spaceA", 5);
  auto future = seal(9, rows::to_row(checkpoint));
  EXPECT_FALSE(warden::checkpoint::open_envelope(
                   warden::schema::make_bytes_view(future))
                   .has_value());
  EXPECT_TRUE(warden::checkpoint::open_envelope(
                  warden::schema::make_bytes_view(
                      seal(1, version_1_row(checkpoint))))
                  .has_value());
}

TEST_F(rocksdb_store_test, load_repairs_overlapping_entries) {
  auto store = warden::checkpoint::rocksdb_store{storage()};
  auto checkpoint = sample_checkpoint("spaceA", 100);
  checkpoint.in_flight.emplace(
      "p-1", warden::schema::in_flight_entry{.item = {.item_id = "p-1"}});
  ASSERT_FALSE(warden::schema::disjoint(checkpoint));
  store.save("spaceA", checkpoint);

  auto loaded = store.load("spaceA");
  EXPECT_TRUE(warden::schema::disjoint(loaded));
  EXPECT_FALSE(loaded.in_flight.contains("p-1"));
  EXPECT_EQ(loaded.completed.at("p-1").outcome, item_outcome_t::submitted);
}

TEST(checkpoint_repair, keeps_completed_entries) {
  auto checkpoint = warden::checkpoint::make_checkpoint("k");
  checkpoint.in_flight.emplace("a", warden::schema::in_flight_entry{});
  checkpoint.in_flight.emplace("b", warden::schema::in_flight_entry{});
  checkpoint.completed.emplace("b", warden::schema::completed_entry{});
  EXPECT_EQ(warden::checkpoint::repair(checkpoint),
            std::vector<std::string>{"b"});
  EXPECT_EQ(warden::schema::in_flight_item_ids(checkpoint),
            std::set<std::string>{"a"});
  EXPECT_TRUE(warden::checkpoint::repair(checkpoint).empty());
}

TEST_F(rocksdb_store_test, participant_flushes_on_persist) {
  auto store = warden::checkpoint::rocksdb_store{storage()};
  auto participant = warden::checkpoint::store_participant{store};
  EXPECT_TRUE(participant.quiesce().ok);
  EXPECT_TRUE(participant.persist().ok);
  EXPECT_TRUE(participant.release().ok);
}
