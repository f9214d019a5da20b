#include <gtest/gtest.h>

#include "analysis/partition_key_optimizer.h"

using namespace analysis;

namespace {

OperationRecord read(OperationKind kind) {
  OperationRecord r;
  r.kind = kind;
  r.table_name = "events";
  r.key_schema = storage::KeySchema{"user_id", std::string("ts")};
  r.success = true;
  return r;
}

}  // namespace

TEST(PartitionKeyOptimizer, UnfilteredScanIsAWarning) {
  PartitionKeyOptimizer opt;
  const auto out = opt.Observe(read(OperationKind::Scan));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].source, "partition_key_optimizer");
  EXPECT_EQ(out[0].severity, Severity::Warning);
  EXPECT_NE(out[0].message.find("use query with an equality condition on partition key user_id instead of scan"),
            std::string::npos);
}

TEST(PartitionKeyOptimizer, NarrowFilteredScanIsInfo) {
  PartitionKeyOptimizer opt;
  auto scan = read(OperationKind::Scan);
  scan.has_filter = true;
  scan.item_count = 2;
  const auto out = opt.Observe(scan);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].severity, Severity::Info);
}

TEST(PartitionKeyOptimizer, BroadFilteredScanIsAWarning) {
  PartitionKeyOptimizer opt;
  auto scan = read(OperationKind::Scan);
  scan.has_filter = true;
  scan.item_count = 11;
  const auto out = opt.Observe(scan);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].severity, Severity::Warning);
}

TEST(PartitionKeyOptimizer, QueryWithoutPartitionEqualityIsAWarning) {
  PartitionKeyOptimizer opt;
  auto q = read(OperationKind::Query);
  q.success = false;
  q.pins_partition_key = false;
  const auto out = opt.Observe(q);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].severity, Severity::Warning);
  EXPECT_NE(out[0].message.find("user_id"), std::string::npos);
}

TEST(PartitionKeyOptimizer, EfficientQueryIsSilent) {
  PartitionKeyOptimizer opt;
  auto q = read(OperationKind::Query);
  q.pins_partition_key = true;
  q.partition_item_count = 3;
  EXPECT_TRUE(opt.Observe(q).empty());
}

TEST(PartitionKeyOptimizer, HotPartitionWithoutSortConditionIsInfo) {
  OptimizerConfig cfg;
  cfg.hot_partition_items = 5;
  PartitionKeyOptimizer opt(cfg);

  auto q = read(OperationKind::Query);
  q.pins_partition_key = true;
  q.partition_item_count = 6;
  auto out = opt.Observe(q);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].severity, Severity::Info);
  EXPECT_NE(out[0].message.find("sort key ts"), std::string::npos);

  q.has_sort_key_condition = true;
  EXPECT_TRUE(opt.Observe(q).empty());
}

TEST(PartitionKeyOptimizer, IgnoresPointReadsAndUnknownTables) {
  PartitionKeyOptimizer opt;
  EXPECT_TRUE(opt.Observe(read(OperationKind::GetItem)).empty());
  EXPECT_TRUE(opt.Observe(read(OperationKind::PutItem)).empty());

  auto scan = read(OperationKind::Scan);
  scan.key_schema.reset();
  EXPECT_TRUE(opt.Observe(scan).empty());
}
