#include "partition_key_optimizer.h"

#include <string>

namespace analysis {

PartitionKeyOptimizer::PartitionKeyOptimizer(OptimizerConfig config) : config_(config) {}

std::vector<Advisory> PartitionKeyOptimizer::Observe(const OperationRecord& record) {
  std::vector<Advisory> out;
  if (!record.key_schema) return out;
  if (record.kind != OperationKind::Scan && record.kind != OperationKind::Query) return out;

  const std::string& pk = record.key_schema->partition_key;
  const std::string table = record.table_name;

  if (record.kind == OperationKind::Scan) {
    Advisory a;
    a.source = kSource;
    if (!record.has_filter) {
      a.severity = Severity::Warning;
      a.message = "full table scan of " + table + " without a filter; use query with an equality condition on "
                  "partition key " + pk + " instead of scan";
    } else if (record.success && record.item_count > config_.small_scan_result) {
      a.severity = Severity::Warning;
      a.message = "filtered scan of " + table + " returned " + std::to_string(record.item_count) +
                  " items after reading every item; use query with an equality condition on partition key " +
                  pk + " instead of scan";
    } else {
      a.severity = Severity::Info;
      a.message = "scan of " + table + " reads every item before filtering; use query with an equality "
                  "condition on partition key " + pk + " instead of scan";
    }
    out.push_back(a);
    return out;
  }

  if (!record.pins_partition_key) {
    out.push_back(Advisory{kSource, Severity::Warning,
                           "query on " + table + " does not pin partition key " + pk +
                               " with an equality condition; add " + pk + " = :value to the key condition"});
    return out;
  }

  const auto& sk = record.key_schema->sort_key;
  if (record.success && sk && !record.has_sort_key_condition &&
      record.partition_item_count > config_.hot_partition_items) {
    out.push_back(Advisory{kSource, Severity::Info,
                           "query on " + table + " reads all " + std::to_string(record.partition_item_count) +
                               " items of the partition; add a condition on sort key " + *sk +
                               " to narrow the range"});
  }
  return out;
}

}  // namespace analysis
