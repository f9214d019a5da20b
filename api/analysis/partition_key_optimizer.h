#pragma once

#include <cstddef>
#include <vector>

#include "operation_record.h"

namespace analysis {

struct OptimizerConfig {
  size_t small_scan_result = 10;     // filtered scans returning at most this many items are info only
  size_t hot_partition_items = 25;   // partition size that makes a missing sort-key condition worth noting
};

// Judges query and scan records against the table's key schema. Stateless;
// never rejects an operation.
class PartitionKeyOptimizer : public IObserver {
 public:
  explicit PartitionKeyOptimizer(OptimizerConfig config = OptimizerConfig());

  std::vector<Advisory> Observe(const OperationRecord& record) override;

  static constexpr const char* kSource = "partition_key_optimizer";

 private:
  OptimizerConfig config_;
};

}  // namespace analysis
