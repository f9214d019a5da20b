#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "operation_record.h"

namespace analysis {

struct IndexAdvisorConfig {
  size_t window = 50;
  double scan_ratio_threshold = 0.5;
  size_t min_scans = 5;

  // Items examined per item returned by a single query or scan.
  double efficiency_warning_ratio = 2.0;
  double efficiency_critical_ratio = 10.0;
};

enum class ReadEfficiency {
  Efficient,
  Warning,
  Critical,
};

// "efficient", "warning" or "critical".
const char* ReadEfficiencyName(ReadEfficiency e);

struct ReadEfficiencyReport {
  double ratio = 0.0;  // scanned / max(returned, 1)
  ReadEfficiency status = ReadEfficiency::Efficient;
};

struct IndexCandidate {
  std::string attribute;
  std::string index_name;  // "<attribute>-index"
  size_t filter_count = 0;
};

struct IndexSuggestion {
  std::string table_name;
  bool active = false;
  double scan_ratio = 0.0;
  size_t scans = 0;
  size_t window_size = 0;
  std::vector<IndexCandidate> candidates;  // most filtered first
  std::optional<ReadEfficiencyReport> last_read;  // latest query or scan
};

// Tracks the last N successful reads per table and proposes global secondary
// indexes for attributes repeatedly filtered by scans. Each query and scan is
// also graded by how many items it examined per item returned.
class IndexAdvisor : public IObserver {
 public:
  explicit IndexAdvisor(IndexAdvisorConfig config = IndexAdvisorConfig());

  std::vector<Advisory> Observe(const OperationRecord& record) override;

  IndexSuggestion Suggestion(const std::string& table_name) const;

  ReadEfficiencyReport RateRead(size_t scanned_count, size_t returned_count) const;

  static constexpr const char* kSource = "index_advisor";

 private:
  struct Sample {
    bool scan = false;
    std::vector<std::string> filtered;  // non-key attributes
  };

  struct TableWindow {
    std::deque<Sample> samples;
    bool active = false;
    std::optional<ReadEfficiencyReport> last_read;
  };

  IndexSuggestion Evaluate(const std::string& table_name, TableWindow& w) const;

  IndexAdvisorConfig config_;
  mutable std::mutex mu_;
  std::map<std::string, TableWindow> tables_;
};

}  // namespace analysis
