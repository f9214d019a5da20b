#include "runtime_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

int clamp_int(int value, int min_v, int max_v) {
  return std::max(min_v, std::min(value, max_v));
}

double clamp_double(double value, double min_v, double max_v) {
  return std::max(min_v, std::min(value, max_v));
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

int getenv_int(const char* name, int default_value) {
  const char* v = std::getenv(name);
  if (!v || !*v) return default_value;
  char* end = nullptr;
  long parsed = std::strtol(v, &end, 10);
  if (end == v || *end != '\0') {
    std::cerr << "[config] ignoring " << name << "=" << v << " (not an integer)" << std::endl;
    return default_value;
  }
  return static_cast<int>(parsed);
}

double getenv_double(const char* name, double default_value) {
  const char* v = std::getenv(name);
  if (!v || !*v) return default_value;
  char* end = nullptr;
  double parsed = std::strtod(v, &end);
  if (end == v || *end != '\0') {
    std::cerr << "[config] ignoring " << name << "=" << v << " (not a number)" << std::endl;
    return default_value;
  }
  return parsed;
}

bool getenv_bool(const char* name, bool default_value) {
  const char* v = std::getenv(name);
  if (!v || !*v) return default_value;
  const std::string s = lower(v);
  if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
  if (s == "0" || s == "false" || s == "no" || s == "off") return false;
  std::cerr << "[config] ignoring " << name << "=" << v << " (not a boolean)" << std::endl;
  return default_value;
}

std::string getenv_string(const char* name, const std::string& default_value) {
  const char* v = std::getenv(name);
  if (!v || !*v) return default_value;
  return v;
}

}  // namespace

RuntimeConfig RuntimeConfig::FromEnv() {
  RuntimeConfig cfg;

  cfg.bind_host = getenv_string("SERVER_BIND_HOST", cfg.bind_host);
  cfg.bind_port = clamp_int(getenv_int("SERVER_BIND_PORT", cfg.bind_port), 1, 65535);
  cfg.log_operations = getenv_bool("LOG_OPERATIONS", cfg.log_operations);
  cfg.seed_sample_data = getenv_bool("SEED_SAMPLE_DATA", cfg.seed_sample_data);

  cfg.cost_read_request = clamp_double(getenv_double("COST_READ_REQUEST", cfg.cost_read_request), 0.0, 1.0);
  cfg.cost_write_request = clamp_double(getenv_double("COST_WRITE_REQUEST", cfg.cost_write_request), 0.0, 1.0);
  cfg.billing_avg_units = clamp_double(getenv_double("BILLING_AVG_UNITS", cfg.billing_avg_units), 0.0, 1e6);

  cfg.scan_small_result = clamp_int(getenv_int("SCAN_SMALL_RESULT", cfg.scan_small_result), 0, 1000000);
  cfg.partition_hot_items = clamp_int(getenv_int("PARTITION_HOT_ITEMS", cfg.partition_hot_items), 0, 1000000);

  cfg.index_window = clamp_int(getenv_int("INDEX_WINDOW", cfg.index_window), 1, 10000);
  cfg.index_scan_ratio = clamp_double(getenv_double("INDEX_SCAN_RATIO", cfg.index_scan_ratio), 0.0, 1.0);
  cfg.index_min_scans = clamp_int(getenv_int("INDEX_MIN_SCANS", cfg.index_min_scans), 1, cfg.index_window);

  cfg.enable_partition_optimizer = getenv_bool("ENABLE_PARTITION_OPTIMIZER", cfg.enable_partition_optimizer);
  cfg.enable_index_advisor = getenv_bool("ENABLE_INDEX_ADVISOR", cfg.enable_index_advisor);
  cfg.enable_streams = getenv_bool("ENABLE_STREAMS", cfg.enable_streams);

  return cfg;
}
