#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "operation_record.h"

namespace analysis {

// Monetary cost per request (or per item for batches).
struct CostTable {
  double read_request = 0.00025;
  double write_request = 0.00125;
  double table_request = 0.0;
};

struct AccountantConfig {
  CostTable costs;
  double billing_avg_units = 5.0;   // average units per op above which PROVISIONED is advised
  int64_t billing_min_operations = 10;
};

struct OperationCharge {
  double cost = 0.0;
  int64_t rcu = 0;
  int64_t wcu = 0;
};

struct CapacitySample {
  int64_t operations = 0;
  int64_t rcu = 0;
  int64_t wcu = 0;
};

struct KindLedger {
  int64_t count = 0;
  double total_cost = 0.0;
  std::vector<double> costs;
};

struct BillingRecommendation {
  storage::BillingMode mode = storage::BillingMode::OnDemand;
  double avg_rcu = 0.0;
  double avg_wcu = 0.0;
  int64_t suggested_rcu = 0;  // only set when avg_rcu exceeds the threshold
  int64_t suggested_wcu = 0;
};

struct LedgerSummary {
  int64_t total_operations = 0;
  double total_cost = 0.0;
  CapacitySample capacity;
  std::map<std::string, KindLedger> by_kind;  // keyed by tool name
  std::map<std::string, CapacitySample> by_table;
  BillingRecommendation recommendation;
};

class CapacityAccountant : public IObserver {
 public:
  explicit CapacityAccountant(AccountantConfig config = AccountantConfig());

  // Pure: the charge a record would incur.
  OperationCharge Charge(const OperationRecord& record) const;

  // Charges the record, appends it to the ledger and the table's sample and
  // returns the charge. Advisories (billing mode mismatch) go to *advisories
  // when non-null.
  OperationCharge Account(const OperationRecord& record, std::vector<Advisory>* advisories);

  std::vector<Advisory> Observe(const OperationRecord& record) override;

  LedgerSummary Summary() const;
  CapacitySample TableSample(const std::string& table_name) const;
  BillingRecommendation RecommendFor(const CapacitySample& sample) const;

  // Operator action only.
  void Reset();

  const AccountantConfig& config() const { return config_; }

 private:
  AccountantConfig config_;

  mutable std::mutex mu_;
  int64_t total_operations_ = 0;
  double total_cost_ = 0.0;
  CapacitySample totals_;
  std::map<std::string, KindLedger> by_kind_;
  std::map<std::string, CapacitySample> by_table_;
  // Last mode advised per table, so a mismatch is reported once per change.
  std::map<std::string, storage::BillingMode> advised_;
};

const char* BillingModeName(storage::BillingMode mode);

}  // namespace analysis
