#pragma once

#include <cstdint>
#include <string>

struct RuntimeConfig {
  std::string bind_host = "127.0.0.1";
  int bind_port = 8080;
  bool log_operations = false;
  bool seed_sample_data = false;

  // Cost table, per request (per item for batches).
  double cost_read_request = 0.00025;
  double cost_write_request = 0.00125;
  double billing_avg_units = 5.0;

  int scan_small_result = 10;
  int partition_hot_items = 25;

  int index_window = 50;
  double index_scan_ratio = 0.5;
  int index_min_scans = 5;

  bool enable_partition_optimizer = true;
  bool enable_index_advisor = true;
  bool enable_streams = true;

  static RuntimeConfig FromEnv();
};
