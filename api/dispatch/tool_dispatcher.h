#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <aws/core/utils/json/JsonSerializer.h>

#include "../../config/runtime_config.h"
#include "../analysis/capacity_accountant.h"
#include "../analysis/index_advisor.h"
#include "../analysis/partition_key_optimizer.h"
#include "../analysis/stream_event_adapter.h"
#include "../protocol/protocol.h"
#include "../storage/storage.h"

namespace dispatch {

struct DispatcherOptions {
  bool log_operations = false;
  bool enable_partition_optimizer = true;
  bool enable_index_advisor = true;
  bool enable_streams = true;

  analysis::AccountantConfig accountant;
  analysis::OptimizerConfig optimizer;
  analysis::IndexAdvisorConfig index_advisor;
};

DispatcherOptions OptionsFromConfig(const RuntimeConfig& cfg);

// Single entry point of the simulator: validates a tool call, runs it against
// the injected store and feeds the resulting operation record through the
// analyzers. Invoke never throws and always returns an envelope.
class ToolDispatcher {
 public:
  explicit ToolDispatcher(storage::IStorage& store, DispatcherOptions options = DispatcherOptions());
  ToolDispatcher(const ToolDispatcher&) = delete;
  ToolDispatcher& operator=(const ToolDispatcher&) = delete;

  protocol::Response Invoke(const std::string& tool_name, Aws::Utils::Json::JsonView params);
  // params_json: a JSON object; empty text means no parameters.
  protocol::Response Invoke(const std::string& tool_name, const std::string& params_json);

  // Extra observer consulted after the built-in ones. Not owned.
  void AddObserver(analysis::IObserver* observer);

  analysis::LedgerSummary GetLedgerSummary() const;
  void ResetLedger();
  analysis::IndexSuggestion GetAdvisories(const std::string& table_name) const;
  std::vector<analysis::StreamEvent> RecentStreamEvents(const std::string& table_name, size_t k) const;

  static const std::vector<std::string>& ListTools();

  const analysis::CapacityAccountant& accountant() const { return accountant_; }

 private:
  protocol::Response Dispatch(analysis::OperationKind kind, Aws::Utils::Json::JsonView params);

  protocol::Response CreateTable(Aws::Utils::Json::JsonView params);
  protocol::Response DescribeTable(Aws::Utils::Json::JsonView params);
  protocol::Response DeleteTable(Aws::Utils::Json::JsonView params);
  protocol::Response PutItem(Aws::Utils::Json::JsonView params);
  protocol::Response GetItem(Aws::Utils::Json::JsonView params);
  protocol::Response UpdateItem(Aws::Utils::Json::JsonView params);
  protocol::Response DeleteItem(Aws::Utils::Json::JsonView params);
  protocol::Response Query(Aws::Utils::Json::JsonView params);
  protocol::Response Scan(Aws::Utils::Json::JsonView params);
  protocol::Response BatchWriteItem(Aws::Utils::Json::JsonView params);
  protocol::Response BatchGetItem(Aws::Utils::Json::JsonView params);

  // Accounts the record, runs the observers and publishes stream events.
  protocol::Response Finish(analysis::OperationRecord& record, protocol::Response r, bool return_events);

  void Log(const std::string& tool_name, const protocol::Response& r) const;

  storage::IStorage& store_;
  DispatcherOptions options_;
  analysis::CapacityAccountant accountant_;
  analysis::PartitionKeyOptimizer optimizer_;
  analysis::IndexAdvisor index_advisor_;
  analysis::StreamEventAdapter streams_;
  std::vector<analysis::IObserver*> observers_;
};

}  // namespace dispatch
