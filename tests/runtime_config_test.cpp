#include <gtest/gtest.h>

#include <cstdlib>

#include "config/runtime_config.h"
#include "dispatch/tool_dispatcher.h"

namespace {

const char* kVars[] = {"SERVER_BIND_PORT",  "LOG_OPERATIONS",      "COST_READ_REQUEST", "INDEX_WINDOW",
                       "INDEX_SCAN_RATIO",  "INDEX_MIN_SCANS",     "ENABLE_STREAMS",    "SCAN_SMALL_RESULT",
                       "BILLING_AVG_UNITS", "PARTITION_HOT_ITEMS", "SEED_SAMPLE_DATA"};

class RuntimeConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { Clear(); }
  void TearDown() override { Clear(); }

  static void Clear() {
    for (const char* v : kVars) unsetenv(v);
  }
};

}  // namespace

TEST_F(RuntimeConfigTest, Defaults) {
  const auto cfg = RuntimeConfig::FromEnv();
  EXPECT_EQ(cfg.bind_port, 8080);
  EXPECT_FALSE(cfg.log_operations);
  EXPECT_DOUBLE_EQ(cfg.cost_read_request, 0.00025);
  EXPECT_DOUBLE_EQ(cfg.cost_write_request, 0.00125);
  EXPECT_EQ(cfg.index_window, 50);
  EXPECT_DOUBLE_EQ(cfg.index_scan_ratio, 0.5);
  EXPECT_EQ(cfg.index_min_scans, 5);
  EXPECT_TRUE(cfg.enable_streams);
}

TEST_F(RuntimeConfigTest, OverridesAndClamps) {
  setenv("SERVER_BIND_PORT", "9000", 1);
  setenv("LOG_OPERATIONS", "Yes", 1);
  setenv("COST_READ_REQUEST", "0.001", 1);
  setenv("INDEX_SCAN_RATIO", "7", 1);
  setenv("INDEX_WINDOW", "0", 1);
  setenv("ENABLE_STREAMS", "off", 1);

  const auto cfg = RuntimeConfig::FromEnv();
  EXPECT_EQ(cfg.bind_port, 9000);
  EXPECT_TRUE(cfg.log_operations);
  EXPECT_DOUBLE_EQ(cfg.cost_read_request, 0.001);
  EXPECT_DOUBLE_EQ(cfg.index_scan_ratio, 1.0);
  EXPECT_EQ(cfg.index_window, 1);
  EXPECT_EQ(cfg.index_min_scans, 1);
  EXPECT_FALSE(cfg.enable_streams);
}

TEST_F(RuntimeConfigTest, MalformedValuesFallBackToDefaults) {
  setenv("SERVER_BIND_PORT", "eighty", 1);
  setenv("COST_READ_REQUEST", "cheap", 1);
  setenv("SEED_SAMPLE_DATA", "maybe", 1);

  const auto cfg = RuntimeConfig::FromEnv();
  EXPECT_EQ(cfg.bind_port, 8080);
  EXPECT_DOUBLE_EQ(cfg.cost_read_request, 0.00025);
  EXPECT_FALSE(cfg.seed_sample_data);
}

TEST_F(RuntimeConfigTest, MapsOntoDispatcherOptions) {
  setenv("SCAN_SMALL_RESULT", "3", 1);
  setenv("INDEX_MIN_SCANS", "7", 1);
  setenv("BILLING_AVG_UNITS", "2.5", 1);

  const auto o = dispatch::OptionsFromConfig(RuntimeConfig::FromEnv());
  EXPECT_EQ(o.optimizer.small_scan_result, 3u);
  EXPECT_EQ(o.optimizer.hot_partition_items, 25u);
  EXPECT_EQ(o.index_advisor.min_scans, 7u);
  EXPECT_DOUBLE_EQ(o.accountant.billing_avg_units, 2.5);
  EXPECT_TRUE(o.enable_partition_optimizer);
}
