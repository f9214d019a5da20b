#include <gtest/gtest.h>

#include "analysis/capacity_accountant.h"

using namespace analysis;

namespace {

OperationRecord record(OperationKind kind, const std::string& table = "orders") {
  OperationRecord r;
  r.kind = kind;
  r.table_name = table;
  r.key_schema = storage::KeySchema{"order_id", std::nullopt};
  r.billing_mode = storage::BillingMode::OnDemand;
  r.success = true;
  return r;
}

}  // namespace

TEST(CapacityAccountant, ChargesPerOperationKind) {
  CapacityAccountant acc;

  auto get = record(OperationKind::GetItem);
  get.bytes_read = 100;
  auto c = acc.Charge(get);
  EXPECT_DOUBLE_EQ(c.cost, 0.00025);
  EXPECT_EQ(c.rcu, 1);
  EXPECT_EQ(c.wcu, 0);

  auto put = record(OperationKind::PutItem);
  put.written_item_bytes = {2500};
  c = acc.Charge(put);
  EXPECT_DOUBLE_EQ(c.cost, 0.00125);
  EXPECT_EQ(c.wcu, 3);

  auto scan = record(OperationKind::Scan);
  scan.bytes_read = 9000;
  EXPECT_EQ(acc.Charge(scan).rcu, 3);

  EXPECT_DOUBLE_EQ(acc.Charge(record(OperationKind::CreateTable)).cost, 0.0);
  EXPECT_DOUBLE_EQ(acc.Charge(record(OperationKind::DescribeTable)).cost, 0.0);
}

TEST(CapacityAccountant, BatchesChargePerItem) {
  CapacityAccountant acc;

  auto bw = record(OperationKind::BatchWriteItem);
  bw.item_count = 3;
  bw.written_item_bytes = {10, 2000, 0};
  auto c = acc.Charge(bw);
  EXPECT_DOUBLE_EQ(c.cost, 3 * 0.00125);
  EXPECT_EQ(c.wcu, 1 + 2 + 1);

  auto bg = record(OperationKind::BatchGetItem);
  bg.item_count = 4;
  bg.read_item_bytes = {10, 10, 0, 5000};
  c = acc.Charge(bg);
  EXPECT_DOUBLE_EQ(c.cost, 4 * 0.00025);
  EXPECT_EQ(c.rcu, 1 + 1 + 1 + 2);
}

TEST(CapacityAccountant, FailedAttemptPaysBaseCost) {
  CapacityAccountant acc;
  auto put = record(OperationKind::PutItem);
  put.success = false;
  auto c = acc.Charge(put);
  EXPECT_DOUBLE_EQ(c.cost, 0.00125);
  EXPECT_EQ(c.wcu, 1);
}

TEST(CapacityAccountant, LedgerTotalIsSumOfCharges) {
  CapacityAccountant acc;
  double sum = 0.0;
  const OperationKind kinds[] = {OperationKind::PutItem, OperationKind::GetItem, OperationKind::Scan,
                                 OperationKind::UpdateItem, OperationKind::DeleteItem, OperationKind::Query};
  double previous = 0.0;
  for (int i = 0; i < 30; ++i) {
    sum += acc.Account(record(kinds[i % 6]), nullptr).cost;
    const double total = acc.Summary().total_cost;
    EXPECT_GE(total, previous);
    previous = total;
  }
  const auto s = acc.Summary();
  EXPECT_EQ(s.total_operations, 30);
  EXPECT_DOUBLE_EQ(s.total_cost, sum);
  EXPECT_EQ(s.by_kind.at("put_item").count, 5);
  EXPECT_EQ(s.by_kind.at("put_item").costs.size(), 5u);
  EXPECT_EQ(s.by_table.at("orders").operations, 30);
}

TEST(CapacityAccountant, ConfigurableCostTable) {
  AccountantConfig cfg;
  cfg.costs.read_request = 0.5;
  CapacityAccountant acc(cfg);
  EXPECT_DOUBLE_EQ(acc.Charge(record(OperationKind::GetItem)).cost, 0.5);
}

TEST(CapacityAccountant, RecommendsProvisionedForHeavyTables) {
  CapacityAccountant acc;

  CapacitySample light{10, 10, 10};
  EXPECT_EQ(acc.RecommendFor(light).mode, storage::BillingMode::OnDemand);

  CapacitySample heavy{10, 100, 10};
  const auto r = acc.RecommendFor(heavy);
  EXPECT_EQ(r.mode, storage::BillingMode::Provisioned);
  EXPECT_DOUBLE_EQ(r.avg_rcu, 10.0);
  EXPECT_EQ(r.suggested_rcu, 12);
  EXPECT_EQ(r.suggested_wcu, 0);
}

TEST(CapacityAccountant, BillingAdvisoryOnceRecommendationDiverges) {
  CapacityAccountant acc;
  std::vector<Advisory> advisories;
  for (int i = 0; i < 12; ++i) {
    auto scan = record(OperationKind::Scan);
    scan.bytes_read = 40000;  // 10 RCU each
    acc.Account(scan, &advisories);
  }
  ASSERT_EQ(advisories.size(), 1u);
  EXPECT_EQ(advisories[0].source, "capacity_accountant");
  EXPECT_EQ(advisories[0].severity, Severity::Info);
  EXPECT_NE(advisories[0].message.find("PROVISIONED"), std::string::npos);
}

TEST(CapacityAccountant, ResetClearsLedger) {
  CapacityAccountant acc;
  acc.Account(record(OperationKind::PutItem), nullptr);
  acc.Reset();
  const auto s = acc.Summary();
  EXPECT_EQ(s.total_operations, 0);
  EXPECT_DOUBLE_EQ(s.total_cost, 0.0);
  EXPECT_TRUE(s.by_kind.empty());
}
