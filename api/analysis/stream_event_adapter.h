#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <aws/core/utils/json/JsonSerializer.h>

#include "operation_record.h"

namespace analysis {

struct StreamEvent {
  std::string event_id;
  std::string table_name;
  storage::MutationKind kind = storage::MutationKind::Insert;
  storage::Item keys;
  std::optional<storage::Item> new_image;
  std::optional<storage::Item> old_image;
  uint64_t sequence = 0;
  size_t size_bytes = 0;
  int64_t created_at_ms = 0;
};

// "INSERT", "MODIFY" or "REMOVE".
const char* StreamEventName(storage::MutationKind kind);

// Turns the effective mutations of a successful write into change events and
// keeps an append-only log per table ordered by sequence number.
class StreamEventAdapter {
 public:
  std::vector<StreamEvent> Publish(const OperationRecord& record);

  // Most recent k events, oldest first.
  std::vector<StreamEvent> Recent(const std::string& table_name, size_t k) const;
  size_t Size(const std::string& table_name) const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<StreamEvent>> log_;
};

// DynamoDB Streams record shape.
Aws::Utils::Json::JsonValue StreamEventToJson(const StreamEvent& e);

}  // namespace analysis
