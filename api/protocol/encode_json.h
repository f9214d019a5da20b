#pragma once

#include <string>
#include <vector>

#include "../analysis/capacity_accountant.h"
#include "../analysis/index_advisor.h"
#include "protocol.h"

namespace protocol {

// DO NOT rename envelope fields without updating the clients that parse
// them (front end, dashboards).
std::string encode_response_json(const Response& r);

std::string encode_ledger_json(const analysis::LedgerSummary& s);
std::string encode_suggestion_json(const analysis::IndexSuggestion& s);
std::string encode_stream_events_json(const std::vector<analysis::StreamEvent>& events);
std::string encode_tools_json(const std::vector<std::string>& tools);

}  // namespace protocol
