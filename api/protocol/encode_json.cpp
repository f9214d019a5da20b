#include "encode_json.h"

#include <iomanip>
#include <sstream>

namespace protocol {
namespace {

std::string json_escape(const std::string& in) {
  std::ostringstream out;
  for (unsigned char c : in) {
    switch (c) {
      case '\"': out << "\\\""; break;
      case '\\': out << "\\\\"; break;
      case '\b': out << "\\b"; break;
      case '\f': out << "\\f"; break;
      case '\n': out << "\\n"; break;
      case '\r': out << "\\r"; break;
      case '\t': out << "\\t"; break;
      default:
        if (c < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(c) << std::dec;
        } else {
          out << static_cast<char>(c);
        }
    }
  }
  return out.str();
}

void append_string(std::ostringstream& out, const std::string& s) {
  out << "\"" << json_escape(s) << "\"";
}

// Costs are small fractions; keep enough digits to sum them back exactly.
void append_double(std::ostringstream& out, double v) {
  std::ostringstream tmp;
  tmp << std::setprecision(12) << v;
  out << tmp.str();
}

void append_sample(std::ostringstream& out, const analysis::CapacitySample& s) {
  out << "{\"operations\":" << s.operations << ",\"rcu\":" << s.rcu << ",\"wcu\":" << s.wcu << "}";
}

void append_recommendation(std::ostringstream& out, const analysis::BillingRecommendation& r) {
  out << "{\"billing_mode\":";
  append_string(out, analysis::BillingModeName(r.mode));
  out << ",\"average_rcu\":";
  append_double(out, r.avg_rcu);
  out << ",\"average_wcu\":";
  append_double(out, r.avg_wcu);
  if (r.suggested_rcu > 0) out << ",\"suggested_rcu\":" << r.suggested_rcu;
  if (r.suggested_wcu > 0) out << ",\"suggested_wcu\":" << r.suggested_wcu;
  out << "}";
}

}  // namespace

std::string encode_response_json(const Response& r) {
  std::ostringstream out;
  out << "{";
  out << "\"success\":" << (r.success ? "true" : "false");
  if (r.data) {
    out << ",\"data\":" << r.data->View().WriteCompact().c_str();
  }
  if (r.error) {
    out << ",\"error\":";
    append_string(out, *r.error);
    out << ",\"error_code\":";
    append_string(out, storage::ErrorCodeName(r.error_code));
  }
  out << ",\"cost\":";
  append_double(out, r.cost);
  out << ",\"capacity\":{\"rcu\":" << r.capacity.rcu << ",\"wcu\":" << r.capacity.wcu << "}";
  out << ",\"advisories\":[";
  for (size_t i = 0; i < r.advisories.size(); ++i) {
    const auto& a = r.advisories[i];
    out << "{\"source\":";
    append_string(out, a.source);
    out << ",\"severity\":";
    append_string(out, analysis::SeverityName(a.severity));
    out << ",\"message\":";
    append_string(out, a.message);
    out << "}";
    if (i + 1 < r.advisories.size()) out << ",";
  }
  out << "]";
  out << "}";
  return out.str();
}

std::string encode_ledger_json(const analysis::LedgerSummary& s) {
  std::ostringstream out;
  out << "{";
  out << "\"total_operations\":" << s.total_operations << ",";
  out << "\"total_cost\":";
  append_double(out, s.total_cost);
  out << ",\"capacity\":";
  append_sample(out, s.capacity);
  out << ",\"by_operation\":{";
  size_t i = 0;
  for (const auto& kv : s.by_kind) {
    if (i++ > 0) out << ",";
    append_string(out, kv.first);
    out << ":{\"count\":" << kv.second.count << ",\"total_cost\":";
    append_double(out, kv.second.total_cost);
    out << ",\"costs\":[";
    for (size_t j = 0; j < kv.second.costs.size(); ++j) {
      if (j > 0) out << ",";
      append_double(out, kv.second.costs[j]);
    }
    out << "]}";
  }
  out << "},\"tables\":{";
  i = 0;
  for (const auto& kv : s.by_table) {
    if (i++ > 0) out << ",";
    append_string(out, kv.first);
    out << ":";
    append_sample(out, kv.second);
  }
  out << "},\"recommendation\":";
  append_recommendation(out, s.recommendation);
  out << "}";
  return out.str();
}

std::string encode_suggestion_json(const analysis::IndexSuggestion& s) {
  std::ostringstream out;
  out << "{\"table\":";
  append_string(out, s.table_name);
  out << ",\"active\":" << (s.active ? "true" : "false");
  out << ",\"scan_ratio\":";
  append_double(out, s.scan_ratio);
  out << ",\"scans\":" << s.scans << ",\"window_size\":" << s.window_size;
  out << ",\"candidates\":[";
  for (size_t i = 0; i < s.candidates.size(); ++i) {
    const auto& c = s.candidates[i];
    out << "{\"attribute\":";
    append_string(out, c.attribute);
    out << ",\"index_name\":";
    append_string(out, c.index_name);
    out << ",\"filter_count\":" << c.filter_count << "}";
    if (i + 1 < s.candidates.size()) out << ",";
  }
  out << "]";
  if (s.last_read) {
    out << ",\"last_read\":{\"ratio\":";
    append_double(out, s.last_read->ratio);
    out << ",\"status\":";
    append_string(out, analysis::ReadEfficiencyName(s.last_read->status));
    out << "}";
  }
  out << "}";
  return out.str();
}

std::string encode_stream_events_json(const std::vector<analysis::StreamEvent>& events) {
  std::ostringstream out;
  out << "{\"Records\":[";
  for (size_t i = 0; i < events.size(); ++i) {
    out << analysis::StreamEventToJson(events[i]).View().WriteCompact().c_str();
    if (i + 1 < events.size()) out << ",";
  }
  out << "]}";
  return out.str();
}

std::string encode_tools_json(const std::vector<std::string>& tools) {
  std::ostringstream out;
  out << "{\"tools\":[";
  for (size_t i = 0; i < tools.size(); ++i) {
    append_string(out, tools[i]);
    if (i + 1 < tools.size()) out << ",";
  }
  out << "]}";
  return out.str();
}

}  // namespace protocol
