#include "stream_event_adapter.h"

#include <algorithm>
#include <cstddef>
#include <string>

#include <aws/core/utils/UUID.h>

#include "../storage/attribute_json.h"

namespace analysis {

using Aws::Utils::Json::JsonValue;

const char* StreamEventName(storage::MutationKind kind) {
  switch (kind) {
    case storage::MutationKind::Insert: return "INSERT";
    case storage::MutationKind::Modify: return "MODIFY";
    case storage::MutationKind::Remove: return "REMOVE";
  }
  return "UNKNOWN";
}

std::vector<StreamEvent> StreamEventAdapter::Publish(const OperationRecord& record) {
  std::vector<StreamEvent> events;
  if (!record.success) return events;

  for (const auto& m : record.mutations) {
    StreamEvent e;
    e.event_id = Aws::String(Aws::Utils::UUID::RandomUUID()).c_str();
    e.table_name = m.table_name;
    e.kind = m.kind;
    e.keys = m.keys;
    e.new_image = m.new_image;
    e.old_image = m.old_image;
    e.sequence = m.sequence;
    e.size_bytes = m.size_bytes;
    e.created_at_ms = record.timestamp_ms;
    events.push_back(std::move(e));
  }
  if (events.empty()) return events;

  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& e : events) {
    auto& log = log_[e.table_name];
    // Concurrent writers may publish slightly out of order.
    auto pos = std::upper_bound(log.begin(), log.end(), e.sequence,
                                [](uint64_t seq, const StreamEvent& x) { return seq < x.sequence; });
    log.insert(pos, e);
  }
  return events;
}

std::vector<StreamEvent> StreamEventAdapter::Recent(const std::string& table_name, size_t k) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = log_.find(table_name);
  if (it == log_.end()) return {};
  const auto& log = it->second;
  const size_t start = log.size() > k ? log.size() - k : 0;
  return std::vector<StreamEvent>(log.begin() + static_cast<std::ptrdiff_t>(start), log.end());
}

size_t StreamEventAdapter::Size(const std::string& table_name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = log_.find(table_name);
  return it == log_.end() ? 0 : it->second.size();
}

JsonValue StreamEventToJson(const StreamEvent& e) {
  JsonValue record;
  record.WithInt64("ApproximateCreationDateTime", e.created_at_ms / 1000);
  record.WithObject("Keys", storage::ItemToJson(e.keys));
  if (e.new_image) record.WithObject("NewImage", storage::ItemToJson(*e.new_image));
  if (e.old_image) record.WithObject("OldImage", storage::ItemToJson(*e.old_image));
  record.WithString("SequenceNumber", std::to_string(e.sequence).c_str());
  record.WithInt64("SizeBytes", static_cast<long long>(e.size_bytes));
  record.WithString("StreamViewType", "NEW_AND_OLD_IMAGES");

  JsonValue out;
  out.WithString("eventID", e.event_id.c_str());
  out.WithString("eventName", StreamEventName(e.kind));
  out.WithString("eventVersion", "1.1");
  out.WithString("eventSource", "aws:dynamodb");
  out.WithString("tableName", e.table_name.c_str());
  out.WithObject("dynamodb", std::move(record));
  return out;
}

}  // namespace analysis
