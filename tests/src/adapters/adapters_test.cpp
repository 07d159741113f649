#include <gtest/gtest.h>
#include <warden/adapters/file_proposal_source.hpp>
#include <warden/adapters/journal_execution_surface.hpp>
#include <warden/adapters/verdict_file_engine.hpp>
#include <warden/testing/common.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace {

void write_file(const std::filesystem::path& path, const std::string& text) {
  auto out = std::ofstream{path, std::ios::binary};
  out << text;
}

warden::schema::pending_item_t item(const std::string& id) {
  return warden::schema::pending_item_t{
      .item_id = id, .origin = "forum", .payload = {}};
}

warden::schema::decision_t approve(const std::string& id) {
  return warden::schema::decision_t{
      .item_id = id,
      .verdict = warden::schema::verdict_t::approve,
      .confidence = 0.9,
      .rationale = "fine",
      .strategy_applied = "balanced"};
}

}  // namespace

TEST(file_proposal_source, reads_items_in_feed_order) {
  auto dir = warden::testing::temp_directory{"warden_feed"};
  write_file(std::filesystem::path{dir.path()} / "spaceA.feed",
             "# pending proposals\n"
             "item-2\tforum\tmove funds\r\n"
             "\n"
             "item-1\tsnapshot\tpayload\twith\ttabs\n"
             "item-2\tforum\tduplicate\n"
             "item-3\n");
  auto source = warden::adapters::file_proposal_source{dir.path()};

  auto result = source.list_pending("spaceA");

  ASSERT_TRUE(warden::schema::succeeded(result));
  const auto& items =
      std::get<std::vector<warden::schema::pending_item_t>>(result);
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0].item_id, "item-2");
  EXPECT_EQ(items[0].origin, "forum");
  EXPECT_EQ(items[0].payload, "move funds");
  EXPECT_EQ(items[1].item_id, "item-1");
  EXPECT_EQ(items[1].payload, "payload\twith\ttabs");
  EXPECT_EQ(items[2].item_id, "item-3");
  EXPECT_EQ(items[2].origin, "");
}

TEST(file_proposal_source, missing_feed_is_permanent) {
  auto dir = warden::testing::temp_directory{"warden_feed_missing"};
  auto source = warden::adapters::file_proposal_source{dir.path()};

  auto result = source.list_pending("spaceA");

  ASSERT_FALSE(warden::schema::succeeded(result));
  EXPECT_EQ(std::get<warden::schema::collaborator_error_t>(result).kind,
            warden::schema::error_kind_t::permanent);
}

TEST(file_proposal_source, source_keys_stay_inside_the_directory) {
  EXPECT_TRUE(warden::adapters::valid_source_key("spaceA.eth"));
  EXPECT_FALSE(warden::adapters::valid_source_key(""));
  EXPECT_FALSE(warden::adapters::valid_source_key(".."));
  EXPECT_FALSE(warden::adapters::valid_source_key("../etc/passwd"));
  EXPECT_FALSE(warden::adapters::valid_source_key("a\\b"));

  auto source = warden::adapters::file_proposal_source{"/tmp"};
  auto result = source.list_pending("../secret");
  ASSERT_FALSE(warden::schema::succeeded(result));
  EXPECT_EQ(std::get<warden::schema::collaborator_error_t>(result).reason,
            "invalid source key '../secret'");
}

TEST(verdict_file_engine, parses_verdict_lines) {
  auto decision = warden::adapters::parse_verdict_line(
      "item-1\treject\t0.85\tconservative\ttreasury drain\twith a tab");
  ASSERT_TRUE(decision);
  EXPECT_EQ(decision->item_id, "item-1");
  EXPECT_EQ(decision->verdict, warden::schema::verdict_t::reject);
  EXPECT_DOUBLE_EQ(decision->confidence, 0.85);
  EXPECT_EQ(decision->strategy_applied, "conservative");
  EXPECT_EQ(decision->rationale, "treasury drain\twith a tab");

  auto bare = warden::adapters::parse_verdict_line("item-1\tabstain\t1\tbase");
  ASSERT_TRUE(bare);
  EXPECT_EQ(bare->rationale, "");

  EXPECT_FALSE(warden::adapters::parse_verdict_line("item-1\tapprove\t0.9"));
  EXPECT_FALSE(
      warden::adapters::parse_verdict_line("item-1\tmaybe\t0.9\tbase"));
  EXPECT_FALSE(
      warden::adapters::parse_verdict_line("item-1\tapprove\t1.2\tbase"));
  EXPECT_FALSE(
      warden::adapters::parse_verdict_line("item-1\tapprove\thigh\tbase"));
  EXPECT_FALSE(warden::adapters::parse_verdict_line("\tapprove\t0.9\tbase"));
}

TEST(verdict_file_engine, first_file_in_name_order_wins) {
  auto dir = warden::testing::temp_directory{"warden_verdicts"};
  auto root = std::filesystem::path{dir.path()};
  write_file(root / "b.verdicts", "item-1\treject\t0.6\tb\tlater file\n");
  write_file(root / "a.verdicts",
             "# engine output\nitem-1\tapprove\t0.9\ta\tearlier file\n"
             "item-1\treject\t0.1\ta\tsecond line\n");
  write_file(root / "c.txt", "item-2\tapprove\t0.9\tc\tnot a verdict file\n");
  auto engine = warden::adapters::verdict_file_engine{root};

  auto result = engine.decide(item("item-1"));

  ASSERT_TRUE(warden::schema::succeeded(result));
  const auto& decision = std::get<warden::schema::decision_t>(result);
  EXPECT_EQ(decision.verdict, warden::schema::verdict_t::approve);
  EXPECT_EQ(decision.rationale, "earlier file");

  auto missing = engine.decide(item("item-2"));
  ASSERT_FALSE(warden::schema::succeeded(missing));
  const auto& error = std::get<warden::schema::collaborator_error_t>(missing);
  EXPECT_EQ(error.kind, warden::schema::error_kind_t::permanent);
  EXPECT_EQ(error.reason, "no verdict for 'item-2'");
}

TEST(verdict_file_engine, malformed_line_is_permanent) {
  auto dir = warden::testing::temp_directory{"warden_verdicts_bad"};
  auto root = std::filesystem::path{dir.path()};
  write_file(root / "a.verdicts", "item-1\tapprove\tsure\tbase\n");
  auto engine = warden::adapters::verdict_file_engine{root};

  auto result = engine.decide(item("item-1"));

  ASSERT_FALSE(warden::schema::succeeded(result));
  EXPECT_EQ(std::get<warden::schema::collaborator_error_t>(result).kind,
            warden::schema::error_kind_t::permanent);
}

TEST(verdict_file_engine, unreadable_directory_is_transient) {
  auto engine =
      warden::adapters::verdict_file_engine{"/nonexistent/warden/verdicts"};

  auto result = engine.decide(item("item-1"));

  ASSERT_FALSE(warden::schema::succeeded(result));
  EXPECT_EQ(std::get<warden::schema::collaborator_error_t>(result).kind,
            warden::schema::error_kind_t::transient);
}

TEST(journal_execution_surface, submits_each_item_once) {
  auto db = warden::testing::temp_directory{"warden_journal"};
  auto storage = warden::storage::make_storage<
      warden::storage::rocksdb_storage_tag>(db.path() + "/db");
  auto journal = warden::adapters::journal_execution_surface{storage};

  auto before = journal.find_submission("item-1", "spaceA");
  ASSERT_TRUE(warden::schema::succeeded(before));
  EXPECT_FALSE(std::get<std::optional<std::string>>(before));

  auto first = journal.submit("spaceA", approve("item-1"));
  ASSERT_TRUE(warden::schema::succeeded(first));
  const auto reference = std::get<std::string>(first);
  EXPECT_EQ(reference.size(), 66u);
  EXPECT_EQ(reference.substr(0, 2), "0x");

  auto changed = approve("item-1");
  changed.verdict = warden::schema::verdict_t::reject;
  auto again = journal.submit("spaceA", changed);
  EXPECT_EQ(std::get<std::string>(again), reference);

  auto found = journal.find_submission("item-1", "spaceA");
  EXPECT_EQ(std::get<std::optional<std::string>>(found), reference);

  auto other_key = journal.find_submission("item-1", "spaceB");
  EXPECT_FALSE(std::get<std::optional<std::string>>(other_key));
  auto elsewhere = journal.submit("spaceB", approve("item-1"));
  EXPECT_NE(std::get<std::string>(elsewhere), reference);
}

TEST(journal_execution_surface, journal_survives_reopening) {
  auto db = warden::testing::temp_directory{"warden_journal_reopen"};
  auto reference = std::string{};
  {
    auto storage = warden::storage::make_storage<
        warden::storage::rocksdb_storage_tag>(db.path() + "/db");
    auto journal = warden::adapters::journal_execution_surface{storage};
    reference = std::get<std::string>(journal.submit("spaceA",
                                                     approve("item-1")));
  }

  auto storage = warden::storage::make_storage<
      warden::storage::rocksdb_storage_tag>(db.path() + "/db");
  auto journal = warden::adapters::journal_execution_surface{storage};
  auto found = journal.find_submission("item-1", "spaceA");
  EXPECT_EQ(std::get<std::optional<std::string>>(found), reference);
}
