#include <gtest/gtest.h>

#include "analysis/index_advisor.h"

using namespace analysis;

namespace {

OperationRecord scan(const std::vector<std::string>& filtered, const std::string& table = "products") {
  OperationRecord r;
  r.kind = OperationKind::Scan;
  r.table_name = table;
  r.key_schema = storage::KeySchema{"product_id", std::nullopt};
  r.success = true;
  r.has_filter = !filtered.empty();
  r.filter_attributes = filtered;
  return r;
}

OperationRecord get(const std::string& table = "products") {
  OperationRecord r;
  r.kind = OperationKind::GetItem;
  r.table_name = table;
  r.key_schema = storage::KeySchema{"product_id", std::nullopt};
  r.success = true;
  return r;
}

}  // namespace

TEST(IndexAdvisor, ConvergesOnRepeatedlyFilteredAttribute) {
  IndexAdvisor advisor;
  for (int i = 0; i < 10; ++i) advisor.Observe(scan({"category"}));

  const auto s = advisor.Suggestion("products");
  EXPECT_TRUE(s.active);
  EXPECT_EQ(s.scans, 10u);
  ASSERT_FALSE(s.candidates.empty());
  EXPECT_EQ(s.candidates[0].attribute, "category");
  EXPECT_EQ(s.candidates[0].index_name, "category-index");
  EXPECT_EQ(s.candidates[0].filter_count, 10u);
}

TEST(IndexAdvisor, NeedsMinimumScans) {
  IndexAdvisor advisor;
  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(advisor.Observe(scan({"category"})).empty());
  }
  EXPECT_FALSE(advisor.Suggestion("products").active);

  const auto out = advisor.Observe(scan({"category"}));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].source, "index_advisor");
  EXPECT_EQ(out[0].severity, Severity::Warning);
  EXPECT_NE(out[0].message.find("category-index"), std::string::npos);
}

TEST(IndexAdvisor, RanksByFrequencyWithFirstSeenTies) {
  IndexAdvisor advisor;
  advisor.Observe(scan({"brand", "color"}));
  advisor.Observe(scan({"color", "price"}));
  advisor.Observe(scan({"price"}));
  advisor.Observe(scan({"brand"}));
  advisor.Observe(scan({"size"}));

  const auto s = advisor.Suggestion("products");
  ASSERT_TRUE(s.active);
  ASSERT_EQ(s.candidates.size(), 4u);
  EXPECT_EQ(s.candidates[0].attribute, "brand");
  EXPECT_EQ(s.candidates[1].attribute, "color");
  EXPECT_EQ(s.candidates[2].attribute, "price");
  EXPECT_EQ(s.candidates[3].attribute, "size");
}

TEST(IndexAdvisor, KeyAttributesAreNotCandidates) {
  IndexAdvisor advisor;
  for (int i = 0; i < 5; ++i) advisor.Observe(scan({"product_id", "category"}));
  const auto s = advisor.Suggestion("products");
  ASSERT_EQ(s.candidates.size(), 1u);
  EXPECT_EQ(s.candidates[0].attribute, "category");
}

TEST(IndexAdvisor, SuggestionPersistsUntilRatioDrops) {
  IndexAdvisor advisor;
  for (int i = 0; i < 6; ++i) advisor.Observe(scan({"category"}));
  ASSERT_TRUE(advisor.Suggestion("products").active);

  // 6 scans of 11 reads: still above half.
  for (int i = 0; i < 5; ++i) EXPECT_FALSE(advisor.Observe(get()).empty());
  EXPECT_TRUE(advisor.Suggestion("products").active);

  // 6 of 12: at the threshold, which clears it.
  EXPECT_TRUE(advisor.Observe(get()).empty());
  EXPECT_FALSE(advisor.Suggestion("products").active);
}

TEST(IndexAdvisor, WindowKeepsLastNReads) {
  IndexAdvisorConfig cfg;
  cfg.window = 4;
  cfg.min_scans = 2;
  IndexAdvisor advisor(cfg);
  for (int i = 0; i < 3; ++i) advisor.Observe(scan({"category"}));
  for (int i = 0; i < 3; ++i) advisor.Observe(get());

  const auto s = advisor.Suggestion("products");
  EXPECT_EQ(s.window_size, 4u);
  EXPECT_EQ(s.scans, 1u);
  EXPECT_FALSE(s.active);
}

TEST(IndexAdvisor, TablesAreIndependentAndDeleteClears) {
  IndexAdvisor advisor;
  for (int i = 0; i < 5; ++i) advisor.Observe(scan({"category"}));
  EXPECT_FALSE(advisor.Suggestion("orders").active);

  OperationRecord drop;
  drop.kind = OperationKind::DeleteTable;
  drop.table_name = "products";
  drop.success = true;
  advisor.Observe(drop);
  const auto s = advisor.Suggestion("products");
  EXPECT_FALSE(s.active);
  EXPECT_EQ(s.window_size, 0u);
}

TEST(IndexAdvisor, WritesDoNotEnterTheWindow) {
  IndexAdvisor advisor;
  OperationRecord put = get();
  put.kind = OperationKind::PutItem;
  advisor.Observe(put);
  EXPECT_EQ(advisor.Suggestion("products").window_size, 0u);
}

TEST(IndexAdvisor, GradesReadEfficiency) {
  IndexAdvisor advisor;
  EXPECT_EQ(advisor.RateRead(0, 0).status, ReadEfficiency::Efficient);
  EXPECT_EQ(advisor.RateRead(3, 2).status, ReadEfficiency::Efficient);
  EXPECT_EQ(advisor.RateRead(4, 2).status, ReadEfficiency::Warning);
  EXPECT_EQ(advisor.RateRead(100, 1).status, ReadEfficiency::Critical);
  EXPECT_DOUBLE_EQ(advisor.RateRead(40, 0).ratio, 40.0);
  EXPECT_STREQ(ReadEfficiencyName(ReadEfficiency::Critical), "critical");
}

TEST(IndexAdvisor, WastefulQueryGetsIndexAdvice) {
  IndexAdvisor advisor;
  OperationRecord q;
  q.kind = OperationKind::Query;
  q.table_name = "products";
  q.key_schema = storage::KeySchema{"category", std::string("product_id")};
  q.success = true;
  q.pins_partition_key = true;
  q.has_filter = true;
  q.filter_attributes = {"product_id", "brand"};
  q.scanned_count = 100;
  q.item_count = 1;

  const auto out = advisor.Observe(q);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].source, "index_advisor");
  EXPECT_EQ(out[0].severity, Severity::Warning);
  EXPECT_NE(out[0].message.find("brand-index"), std::string::npos);
  EXPECT_EQ(out[0].message.find("product_id-index"), std::string::npos);

  const auto s = advisor.Suggestion("products");
  ASSERT_TRUE(s.last_read.has_value());
  EXPECT_EQ(s.last_read->status, ReadEfficiency::Critical);
  EXPECT_DOUBLE_EQ(s.last_read->ratio, 100.0);
  EXPECT_FALSE(s.active);
}

TEST(IndexAdvisor, ModeratelyWastefulScanIsInfo) {
  IndexAdvisor advisor;
  auto r = scan({"category"});
  r.scanned_count = 15;
  r.item_count = 3;
  const auto out = advisor.Observe(r);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].severity, Severity::Info);

  r.scanned_count = 3;
  EXPECT_TRUE(advisor.Observe(r).empty());
  EXPECT_EQ(advisor.Suggestion("products").last_read->status, ReadEfficiency::Efficient);
}

TEST(IndexAdvisor, FailedReadsStayOutOfTheWindow) {
  IndexAdvisor advisor;
  auto failed = scan({});
  failed.success = false;
  EXPECT_TRUE(advisor.Observe(failed).empty());
  EXPECT_EQ(advisor.Suggestion("products").window_size, 0u);

  for (int i = 0; i < 5; ++i) advisor.Observe(scan({"category"}));
  ASSERT_TRUE(advisor.Suggestion("products").active);

  // Still warned while the suggestion is active, but not counted.
  const auto out = advisor.Observe(failed);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].severity, Severity::Warning);
  EXPECT_EQ(advisor.Suggestion("products").window_size, 5u);
}
