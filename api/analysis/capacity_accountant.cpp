#include "capacity_accountant.h"

#include <sstream>

namespace analysis {
namespace {

constexpr int64_t kReadUnitBytes = 4096;
constexpr int64_t kWriteUnitBytes = 1024;

int64_t units_for(size_t bytes, int64_t unit) {
  const int64_t b = static_cast<int64_t>(bytes);
  const int64_t units = (b + unit - 1) / unit;
  return units < 1 ? 1 : units;
}

}  // namespace

const char* BillingModeName(storage::BillingMode mode) {
  return mode == storage::BillingMode::Provisioned ? "PROVISIONED" : "ON_DEMAND";
}

CapacityAccountant::CapacityAccountant(AccountantConfig config) : config_(config) {}

OperationCharge CapacityAccountant::Charge(const OperationRecord& record) const {
  OperationCharge c;
  const CostTable& costs = config_.costs;

  if (IsTableOperation(record.kind)) {
    c.cost = costs.table_request;
    return c;
  }

  // A failed call that reached the store pays for one attempt.
  if (!record.success) {
    if (IsReadOperation(record.kind)) {
      c.cost = costs.read_request;
      c.rcu = 1;
    } else {
      c.cost = costs.write_request;
      c.wcu = 1;
    }
    return c;
  }

  switch (record.kind) {
    case OperationKind::GetItem:
    case OperationKind::Query:
    case OperationKind::Scan:
      c.cost = costs.read_request;
      c.rcu = units_for(record.bytes_read, kReadUnitBytes);
      break;
    case OperationKind::BatchGetItem:
      c.cost = costs.read_request * static_cast<double>(record.item_count);
      for (size_t bytes : record.read_item_bytes) c.rcu += units_for(bytes, kReadUnitBytes);
      break;
    case OperationKind::PutItem:
    case OperationKind::UpdateItem:
    case OperationKind::DeleteItem:
      c.cost = costs.write_request;
      c.wcu = units_for(record.written_item_bytes.empty() ? 0 : record.written_item_bytes.front(),
                        kWriteUnitBytes);
      break;
    case OperationKind::BatchWriteItem:
      c.cost = costs.write_request * static_cast<double>(record.item_count);
      for (size_t bytes : record.written_item_bytes) c.wcu += units_for(bytes, kWriteUnitBytes);
      break;
    default:
      break;
  }
  return c;
}

OperationCharge CapacityAccountant::Account(const OperationRecord& record, std::vector<Advisory>* advisories) {
  const OperationCharge c = Charge(record);

  CapacitySample sample;
  std::optional<storage::BillingMode> advise;
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++total_operations_;
    total_cost_ += c.cost;
    ++totals_.operations;
    totals_.rcu += c.rcu;
    totals_.wcu += c.wcu;

    auto& k = by_kind_[OperationKindName(record.kind)];
    ++k.count;
    k.total_cost += c.cost;
    k.costs.push_back(c.cost);

    if (record.kind == OperationKind::DeleteTable && record.success) {
      by_table_.erase(record.table_name);
      advised_.erase(record.table_name);
      return c;
    }
    if (record.table_name.empty() || !record.key_schema) return c;

    auto& s = by_table_[record.table_name];
    ++s.operations;
    s.rcu += c.rcu;
    s.wcu += c.wcu;
    sample = s;

    if (record.billing_mode && sample.operations >= config_.billing_min_operations) {
      const storage::BillingMode recommended = RecommendFor(sample).mode;
      auto prev = advised_.find(record.table_name);
      const bool changed = prev == advised_.end() || prev->second != recommended;
      if (recommended != *record.billing_mode && changed) advise = recommended;
      advised_[record.table_name] = recommended;
    }
  }

  if (advise && advisories != nullptr) {
    const BillingRecommendation r = RecommendFor(sample);
    std::ostringstream msg;
    msg << "table " << record.table_name << " averages " << r.avg_rcu << " RCU and " << r.avg_wcu
        << " WCU per operation; consider " << BillingModeName(*advise) << " billing";
    if (r.suggested_rcu > 0) msg << ", provisioned RCU: " << r.suggested_rcu;
    if (r.suggested_wcu > 0) msg << ", provisioned WCU: " << r.suggested_wcu;
    advisories->push_back(Advisory{"capacity_accountant", Severity::Info, msg.str()});
  }
  return c;
}

std::vector<Advisory> CapacityAccountant::Observe(const OperationRecord& record) {
  std::vector<Advisory> out;
  Account(record, &out);
  return out;
}

BillingRecommendation CapacityAccountant::RecommendFor(const CapacitySample& sample) const {
  BillingRecommendation r;
  const double ops = static_cast<double>(sample.operations < 1 ? 1 : sample.operations);
  r.avg_rcu = static_cast<double>(sample.rcu) / ops;
  r.avg_wcu = static_cast<double>(sample.wcu) / ops;
  if (r.avg_rcu > config_.billing_avg_units) r.suggested_rcu = static_cast<int64_t>(r.avg_rcu * 1.2);
  if (r.avg_wcu > config_.billing_avg_units) r.suggested_wcu = static_cast<int64_t>(r.avg_wcu * 1.2);
  if (r.suggested_rcu > 0 || r.suggested_wcu > 0) r.mode = storage::BillingMode::Provisioned;
  return r;
}

LedgerSummary CapacityAccountant::Summary() const {
  LedgerSummary out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    out.total_operations = total_operations_;
    out.total_cost = total_cost_;
    out.capacity = totals_;
    out.by_kind = by_kind_;
    out.by_table = by_table_;
  }
  out.recommendation = RecommendFor(out.capacity);
  return out;
}

CapacitySample CapacityAccountant::TableSample(const std::string& table_name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = by_table_.find(table_name);
  if (it == by_table_.end()) return CapacitySample{};
  return it->second;
}

void CapacityAccountant::Reset() {
  std::lock_guard<std::mutex> lock(mu_);
  total_operations_ = 0;
  total_cost_ = 0.0;
  totals_ = CapacitySample{};
  by_kind_.clear();
  by_table_.clear();
  advised_.clear();
}

}  // namespace analysis
