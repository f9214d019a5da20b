#include "index_advisor.h"

#include <algorithm>
#include <sstream>

namespace analysis {
namespace {

std::vector<std::string> non_key_attributes(const std::vector<std::string>& attrs, const storage::KeySchema& ks) {
  std::vector<std::string> out;
  for (const auto& attr : attrs) {
    if (attr == ks.partition_key || (ks.sort_key && attr == *ks.sort_key)) continue;
    out.push_back(attr);
  }
  return out;
}

Advisory efficiency_advisory(const OperationRecord& record, const ReadEfficiencyReport& rate,
                             const std::vector<std::string>& filtered) {
  std::ostringstream msg;
  msg << OperationKindName(record.kind) << " on " << record.table_name << " examined " << record.scanned_count
      << " items to return " << record.item_count << " (ratio " << rate.ratio << ", "
      << ReadEfficiencyName(rate.status) << ")";
  if (rate.status == ReadEfficiency::Critical && !filtered.empty()) {
    msg << "; a global secondary index would turn the filter into a key lookup: ";
    for (size_t i = 0; i < filtered.size(); ++i) {
      if (i > 0) msg << ", ";
      msg << filtered[i] << "-index on " << filtered[i];
    }
  } else {
    msg << "; narrow the key condition or the filter";
  }
  return Advisory{IndexAdvisor::kSource,
                  rate.status == ReadEfficiency::Critical ? Severity::Warning : Severity::Info, msg.str()};
}

}  // namespace

const char* ReadEfficiencyName(ReadEfficiency e) {
  switch (e) {
    case ReadEfficiency::Efficient: return "efficient";
    case ReadEfficiency::Warning: return "warning";
    case ReadEfficiency::Critical: return "critical";
  }
  return "efficient";
}

IndexAdvisor::IndexAdvisor(IndexAdvisorConfig config) : config_(config) {
  if (config_.window < 1) config_.window = 1;
}

IndexSuggestion IndexAdvisor::Evaluate(const std::string& table_name, TableWindow& w) const {
  IndexSuggestion s;
  s.table_name = table_name;
  s.window_size = w.samples.size();

  // Counts in first-seen order; stable_sort keeps that order for ties.
  std::vector<IndexCandidate> counts;
  for (const auto& sample : w.samples) {
    if (!sample.scan) continue;
    ++s.scans;
    for (const auto& attr : sample.filtered) {
      auto it = std::find_if(counts.begin(), counts.end(),
                             [&](const IndexCandidate& c) { return c.attribute == attr; });
      if (it == counts.end()) {
        counts.push_back(IndexCandidate{attr, attr + "-index", 1});
      } else {
        ++it->filter_count;
      }
    }
  }
  if (s.window_size > 0) {
    s.scan_ratio = static_cast<double>(s.scans) / static_cast<double>(s.window_size);
  }

  if (s.scan_ratio <= config_.scan_ratio_threshold) {
    w.active = false;
  } else if (s.scans >= config_.min_scans) {
    w.active = true;
  }

  s.active = w.active;
  s.last_read = w.last_read;
  if (s.active) {
    std::stable_sort(counts.begin(), counts.end(), [](const IndexCandidate& a, const IndexCandidate& b) {
      return a.filter_count > b.filter_count;
    });
    s.candidates = std::move(counts);
  }
  return s;
}

ReadEfficiencyReport IndexAdvisor::RateRead(size_t scanned_count, size_t returned_count) const {
  ReadEfficiencyReport r;
  r.ratio = static_cast<double>(scanned_count) / static_cast<double>(std::max<size_t>(returned_count, 1));
  if (r.ratio >= config_.efficiency_critical_ratio) {
    r.status = ReadEfficiency::Critical;
  } else if (r.ratio >= config_.efficiency_warning_ratio) {
    r.status = ReadEfficiency::Warning;
  }
  return r;
}

std::vector<Advisory> IndexAdvisor::Observe(const OperationRecord& record) {
  std::vector<Advisory> out;

  if (record.kind == OperationKind::DeleteTable && record.success) {
    std::lock_guard<std::mutex> lock(mu_);
    tables_.erase(record.table_name);
    return out;
  }
  if (!IsReadOperation(record.kind) || !record.key_schema) return out;

  const bool graded = record.success && (record.kind == OperationKind::Query || record.kind == OperationKind::Scan);
  const auto filtered = non_key_attributes(record.filter_attributes, *record.key_schema);

  IndexSuggestion s;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tables_.find(record.table_name);
    if (record.success) {
      // Only successful reads describe the access pattern.
      if (it == tables_.end()) it = tables_.emplace(record.table_name, TableWindow()).first;
      auto& w = it->second;
      Sample sample;
      sample.scan = record.kind == OperationKind::Scan;
      if (sample.scan) sample.filtered = filtered;
      w.samples.push_back(std::move(sample));
      while (w.samples.size() > config_.window) w.samples.pop_front();
      if (graded) w.last_read = RateRead(record.scanned_count, record.item_count);
    } else if (it == tables_.end()) {
      return out;
    }
    s = Evaluate(record.table_name, it->second);
  }

  if (graded && s.last_read && s.last_read->status != ReadEfficiency::Efficient) {
    out.push_back(efficiency_advisory(record, *s.last_read, filtered));
  }
  if (!s.active) return out;

  std::ostringstream msg;
  msg << "table " << record.table_name << ": " << s.scans << " of the last " << s.window_size
      << " reads were scans";
  if (s.candidates.empty()) {
    msg << "; design queries around the key schema or add a filtered attribute index";
  } else {
    msg << "; consider a global secondary index on ";
    for (size_t i = 0; i < s.candidates.size(); ++i) {
      if (i > 0) msg << ", ";
      msg << s.candidates[i].attribute << " (" << s.candidates[i].index_name << ", filtered "
          << s.candidates[i].filter_count << "x)";
    }
  }
  out.push_back(Advisory{kSource, Severity::Warning, msg.str()});
  return out;
}

IndexSuggestion IndexAdvisor::Suggestion(const std::string& table_name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = tables_.find(table_name);
  if (it == tables_.end()) {
    IndexSuggestion s;
    s.table_name = table_name;
    return s;
  }
  // Recomputed on a copy; the window itself only changes on Observe.
  TableWindow copy = it->second;
  return Evaluate(table_name, copy);
}

}  // namespace analysis
