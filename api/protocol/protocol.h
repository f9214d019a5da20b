#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <aws/core/utils/json/JsonSerializer.h>

#include "../analysis/operation_record.h"
#include "../analysis/stream_event_adapter.h"
#include "../storage/errors.h"

namespace protocol {

struct Capacity {
  int64_t rcu = 0;
  int64_t wcu = 0;
};

// Uniform envelope returned by every tool invocation.
struct Response {
  bool success = false;
  std::optional<Aws::Utils::Json::JsonValue> data;
  std::optional<std::string> error;
  storage::ErrorCode error_code = storage::ErrorCode::None;
  double cost = 0.0;
  Capacity capacity;
  std::vector<analysis::Advisory> advisories;
  // Events published by this call; only rendered inside data on request.
  std::vector<analysis::StreamEvent> stream_events;
};

}  // namespace protocol
