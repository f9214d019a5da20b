#include "tool_dispatcher.h"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "../expression/key_condition.h"
#include "../storage/attribute_json.h"

namespace dispatch {
namespace {

using Aws::Utils::Array;
using Aws::Utils::Json::JsonValue;
using Aws::Utils::Json::JsonView;
using analysis::OperationKind;
using analysis::OperationRecord;
using protocol::Response;

// Malformed call shape. Never escapes Invoke.
class ParamError : public std::runtime_error {
 public:
  explicit ParamError(const std::string& what) : std::runtime_error(what) {}
};

int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Response structural_error(const std::string& message) {
  Response r;
  r.success = false;
  r.error_code = storage::ErrorCode::InvalidParameters;
  r.error = storage::StoreError(r.error_code, message).ToString();
  return r;
}

void fail(Response& r, const storage::StoreError& e) {
  r.success = false;
  r.error_code = e.code;
  r.error = e.ToString();
}

JsonView require(JsonView p, const char* key) {
  if (!p.ValueExists(key)) throw ParamError(std::string("missing required parameter ") + key);
  return p.GetObject(key);
}

std::string require_string(JsonView p, const char* key) {
  JsonView v = require(p, key);
  if (!v.IsString()) throw ParamError(std::string("parameter ") + key + " must be a string");
  return v.AsString().c_str();
}

std::string optional_string(JsonView p, const char* key) {
  if (!p.ValueExists(key)) return "";
  return require_string(p, key);
}

bool optional_bool(JsonView p, const char* key, bool def) {
  if (!p.ValueExists(key)) return def;
  JsonView v = p.GetObject(key);
  if (!v.IsBool()) throw ParamError(std::string("parameter ") + key + " must be a boolean");
  return v.AsBool();
}

std::optional<size_t> optional_limit(JsonView p) {
  if (!p.ValueExists("limit")) return std::nullopt;
  JsonView v = p.GetObject("limit");
  if (!v.IsIntegerType() || v.AsInt64() < 1) throw ParamError("parameter limit must be a positive integer");
  return static_cast<size_t>(v.AsInt64());
}

storage::Item item_from(JsonView v, const std::string& what) {
  if (!v.IsObject()) throw ParamError(what + " must be an object");
  std::string bad;
  auto item = storage::ItemFromJson(v, &bad);
  if (!item) throw ParamError("attribute " + bad + " in " + what + " has an unsupported value kind");
  return *item;
}

storage::Item require_item(JsonView p, const char* key) {
  return item_from(require(p, key), key);
}

std::vector<storage::Item> require_item_list(JsonView p, const char* key, size_t max_size) {
  JsonView v = require(p, key);
  if (!v.IsListType()) throw ParamError(std::string("parameter ") + key + " must be a list");
  const Array<JsonView> arr = v.AsArray();
  if (arr.GetLength() > max_size) {
    throw ParamError(std::string("parameter ") + key + " accepts at most " + std::to_string(max_size) +
                     " entries");
  }
  std::vector<storage::Item> out;
  out.reserve(arr.GetLength());
  for (size_t i = 0; i < arr.GetLength(); ++i) {
    out.push_back(item_from(arr[i], std::string(key) + "[" + std::to_string(i) + "]"));
  }
  return out;
}

expression::Values parse_values(JsonView p) {
  expression::Values out;
  if (!p.ValueExists("expression_values")) return out;
  JsonView v = p.GetObject("expression_values");
  if (!v.IsObject()) throw ParamError("parameter expression_values must be an object");
  for (const auto& kv : v.GetAllObjects()) {
    const std::string name = kv.first.c_str();
    auto value = storage::AttributeFromJson(kv.second);
    if (!value) throw ParamError("expression value " + name + " has an unsupported value kind");
    out.emplace(name, std::move(*value));
  }
  return out;
}

expression::Names parse_names(JsonView p) {
  expression::Names out;
  if (!p.ValueExists("expression_names")) return out;
  JsonView v = p.GetObject("expression_names");
  if (!v.IsObject()) throw ParamError("parameter expression_names must be an object");
  for (const auto& kv : v.GetAllObjects()) {
    if (!kv.second.IsString()) {
      throw ParamError(std::string("expression name ") + kv.first.c_str() + " must map to a string");
    }
    out.emplace(kv.first.c_str(), kv.second.AsString().c_str());
  }
  return out;
}

storage::BillingMode parse_billing_mode(JsonView p) {
  const std::string mode = optional_string(p, "billing_mode");
  if (mode.empty() || mode == "ON_DEMAND" || mode == "PAY_PER_REQUEST") return storage::BillingMode::OnDemand;
  if (mode == "PROVISIONED") return storage::BillingMode::Provisioned;
  throw ParamError("unknown billing_mode " + mode + " (expected ON_DEMAND or PROVISIONED)");
}

storage::KeySchema parse_key_schema(JsonView p) {
  JsonView v = require(p, "key_schema");
  if (!v.IsObject()) throw ParamError("parameter key_schema must be an object");
  storage::KeySchema ks;
  ks.partition_key = optional_string(v, "partition_key");
  if (v.ValueExists("sort_key")) ks.sort_key = require_string(v, "sort_key");
  return ks;
}

JsonValue table_json(const storage::TableDescription& d, const char* status) {
  JsonValue ks;
  ks.WithString("partition_key", d.key_schema.partition_key.c_str());
  if (d.key_schema.sort_key) ks.WithString("sort_key", d.key_schema.sort_key->c_str());

  JsonValue t;
  t.WithString("table_name", d.table_name.c_str());
  t.WithObject("key_schema", std::move(ks));
  t.WithString("billing_mode", analysis::BillingModeName(d.billing_mode));
  t.WithInt64("item_count", static_cast<long long>(d.item_count));
  t.WithInt64("size_bytes", static_cast<long long>(d.size_bytes));
  t.WithInt64("created_at", d.created_at);
  t.WithString("status", status);

  JsonValue out;
  out.WithObject("table", std::move(t));
  return out;
}

JsonValue items_json(const std::vector<storage::Item>& items) {
  Array<JsonValue> arr(items.size());
  for (size_t i = 0; i < items.size(); ++i) arr[i] = storage::ItemToJson(items[i]);
  JsonValue out;
  out.WithArray("items", std::move(arr));
  out.WithInt64("count", static_cast<long long>(items.size()));
  return out;
}

// Observers judge the call against the table that served it.
void adopt_table(OperationRecord& record, const storage::TableSchema& table) {
  if (table.table_name.empty()) return;
  record.key_schema = table.key_schema;
  record.billing_mode = table.billing_mode;
}

JsonValue error_json(JsonValue entry, const storage::StoreError& e) {
  entry.WithString("error", e.ToString().c_str());
  entry.WithString("error_code", storage::ErrorCodeName(e.code));
  return entry;
}

}  // namespace

DispatcherOptions OptionsFromConfig(const RuntimeConfig& cfg) {
  DispatcherOptions o;
  o.log_operations = cfg.log_operations;
  o.enable_partition_optimizer = cfg.enable_partition_optimizer;
  o.enable_index_advisor = cfg.enable_index_advisor;
  o.enable_streams = cfg.enable_streams;

  o.accountant.costs.read_request = cfg.cost_read_request;
  o.accountant.costs.write_request = cfg.cost_write_request;
  o.accountant.billing_avg_units = cfg.billing_avg_units;

  o.optimizer.small_scan_result = static_cast<size_t>(cfg.scan_small_result);
  o.optimizer.hot_partition_items = static_cast<size_t>(cfg.partition_hot_items);

  o.index_advisor.window = static_cast<size_t>(cfg.index_window);
  o.index_advisor.scan_ratio_threshold = cfg.index_scan_ratio;
  o.index_advisor.min_scans = static_cast<size_t>(cfg.index_min_scans);
  return o;
}

ToolDispatcher::ToolDispatcher(storage::IStorage& store, DispatcherOptions options)
    : store_(store),
      options_(std::move(options)),
      accountant_(options_.accountant),
      optimizer_(options_.optimizer),
      index_advisor_(options_.index_advisor) {
  if (options_.enable_partition_optimizer) observers_.push_back(&optimizer_);
  if (options_.enable_index_advisor) observers_.push_back(&index_advisor_);
}

void ToolDispatcher::AddObserver(analysis::IObserver* observer) {
  if (observer != nullptr) observers_.push_back(observer);
}

const std::vector<std::string>& ToolDispatcher::ListTools() {
  static const std::vector<std::string> tools = [] {
    std::vector<std::string> out;
    for (auto k : {OperationKind::CreateTable, OperationKind::DescribeTable, OperationKind::DeleteTable,
                   OperationKind::PutItem, OperationKind::GetItem, OperationKind::UpdateItem,
                   OperationKind::DeleteItem, OperationKind::Query, OperationKind::Scan,
                   OperationKind::BatchWriteItem, OperationKind::BatchGetItem}) {
      out.push_back(analysis::OperationKindName(k));
    }
    return out;
  }();
  return tools;
}

Response ToolDispatcher::Invoke(const std::string& tool_name, const std::string& params_json) {
  if (params_json.empty()) {
    const JsonValue empty(Aws::String("{}"));
    return Invoke(tool_name, empty.View());
  }
  JsonValue parsed(Aws::String(params_json.c_str()));
  if (!parsed.WasParseSuccessful()) {
    Response r = structural_error(std::string("parameters are not valid JSON: ") +
                                  parsed.GetErrorMessage().c_str());
    Log(tool_name, r);
    return r;
  }
  return Invoke(tool_name, parsed.View());
}

Response ToolDispatcher::Invoke(const std::string& tool_name, JsonView params) {
  Response r;
  const auto kind = analysis::OperationKindFromName(tool_name);
  if (!kind) {
    r = structural_error("unknown tool " + tool_name);
  } else if (!params.IsObject()) {
    r = structural_error("parameters must be a JSON object");
  } else {
    try {
      r = Dispatch(*kind, params);
    } catch (const ParamError& e) {
      r = structural_error(e.what());
    }
  }
  Log(tool_name, r);
  return r;
}

Response ToolDispatcher::Dispatch(OperationKind kind, JsonView params) {
  switch (kind) {
    case OperationKind::CreateTable: return CreateTable(params);
    case OperationKind::DescribeTable: return DescribeTable(params);
    case OperationKind::DeleteTable: return DeleteTable(params);
    case OperationKind::PutItem: return PutItem(params);
    case OperationKind::GetItem: return GetItem(params);
    case OperationKind::UpdateItem: return UpdateItem(params);
    case OperationKind::DeleteItem: return DeleteItem(params);
    case OperationKind::Query: return Query(params);
    case OperationKind::Scan: return Scan(params);
    case OperationKind::BatchWriteItem: return BatchWriteItem(params);
    case OperationKind::BatchGetItem: return BatchGetItem(params);
  }
  throw ParamError("unsupported tool");
}

Response ToolDispatcher::Finish(OperationRecord& record, Response r, bool return_events) {
  r.success = record.success;
  if (!record.success) fail(r, record.error);

  for (auto* observer : observers_) {
    auto advisories = observer->Observe(record);
    r.advisories.insert(r.advisories.end(), advisories.begin(), advisories.end());
  }

  const analysis::OperationCharge charge = accountant_.Account(record, &r.advisories);
  r.cost = charge.cost;
  r.capacity.rcu = charge.rcu;
  r.capacity.wcu = charge.wcu;

  if (options_.enable_streams && record.success && !record.mutations.empty()) {
    r.stream_events = streams_.Publish(record);
    if (return_events && r.data) {
      if (record.kind == OperationKind::BatchWriteItem) {
        Array<JsonValue> arr(r.stream_events.size());
        for (size_t i = 0; i < r.stream_events.size(); ++i) arr[i] = analysis::StreamEventToJson(r.stream_events[i]);
        r.data->WithArray("stream_events", std::move(arr));
      } else {
        r.data->WithObject("stream_event", analysis::StreamEventToJson(r.stream_events.front()));
      }
    }
  }
  return r;
}

Response ToolDispatcher::CreateTable(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::CreateTable;
  record.table_name = require_string(params, "table_name");
  const storage::KeySchema ks = parse_key_schema(params);
  const storage::BillingMode mode = parse_billing_mode(params);
  record.timestamp_ms = now_ms();

  Response r;
  auto out = store_.CreateTable(record.table_name, ks, mode);
  record.success = out.IsSuccess();
  if (out.IsSuccess()) {
    record.key_schema = ks;
    record.billing_mode = mode;
    r.data = table_json(out.GetResult(), "ACTIVE");
  } else {
    record.error = out.GetError();
  }
  return Finish(record, std::move(r), false);
}

Response ToolDispatcher::DescribeTable(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::DescribeTable;
  record.table_name = require_string(params, "table_name");
  record.timestamp_ms = now_ms();

  Response r;
  auto out = store_.DescribeTable(record.table_name);
  record.success = out.IsSuccess();
  if (out.IsSuccess()) {
    record.key_schema = out.GetResult().key_schema;
    record.billing_mode = out.GetResult().billing_mode;
    r.data = table_json(out.GetResult(), "ACTIVE");
  } else {
    record.error = out.GetError();
  }
  return Finish(record, std::move(r), false);
}

Response ToolDispatcher::DeleteTable(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::DeleteTable;
  record.table_name = require_string(params, "table_name");
  record.timestamp_ms = now_ms();

  Response r;
  auto out = store_.DeleteTable(record.table_name);
  record.success = out.IsSuccess();
  if (out.IsSuccess()) {
    record.key_schema = out.GetResult().key_schema;
    record.billing_mode = out.GetResult().billing_mode;
    r.data = table_json(out.GetResult(), "DELETING");
  } else {
    record.error = out.GetError();
  }
  return Finish(record, std::move(r), false);
}

Response ToolDispatcher::PutItem(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::PutItem;
  record.key_based = true;
  record.table_name = require_string(params, "table_name");
  const storage::Item item = require_item(params, "item");
  const bool return_events = optional_bool(params, "return_stream_event", false);
  record.timestamp_ms = now_ms();

  Response r;
  storage::TableSchema table;
  auto out = store_.PutItem(record.table_name, item, &table);
  adopt_table(record, table);
  record.success = out.IsSuccess();
  if (!out.IsSuccess()) {
    record.error = out.GetError();
    return Finish(record, std::move(r), false);
  }

  const storage::Mutation& m = out.GetResult();
  record.item_count = 1;
  record.written_item_bytes.push_back(m.size_bytes);
  record.mutations.push_back(m);

  JsonValue data;
  data.WithObject("item", storage::ItemToJson(item));
  data.WithBool("replaced", m.kind == storage::MutationKind::Modify);
  r.data = std::move(data);
  return Finish(record, std::move(r), return_events);
}

Response ToolDispatcher::GetItem(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::GetItem;
  record.key_based = true;
  record.table_name = require_string(params, "table_name");
  const storage::Item key = require_item(params, "key");
  record.timestamp_ms = now_ms();

  Response r;
  storage::TableSchema table;
  auto out = store_.GetItem(record.table_name, key, &table);
  adopt_table(record, table);
  record.success = out.IsSuccess();
  if (!out.IsSuccess()) {
    record.error = out.GetError();
    return Finish(record, std::move(r), false);
  }

  const storage::GetResult& g = out.GetResult();
  record.item_count = g.item ? 1 : 0;
  record.scanned_count = record.item_count;
  record.bytes_read = g.bytes_read;

  JsonValue data;
  data.WithBool("found", g.item.has_value());
  if (g.item) data.WithObject("item", storage::ItemToJson(*g.item));
  r.data = std::move(data);
  return Finish(record, std::move(r), false);
}

Response ToolDispatcher::UpdateItem(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::UpdateItem;
  record.key_based = true;
  record.table_name = require_string(params, "table_name");

  storage::UpdateSpec spec;
  spec.table_name = record.table_name;
  spec.key = require_item(params, "key");
  spec.update_expression = require_string(params, "update_expression");
  spec.values = parse_values(params);
  spec.names = parse_names(params);
  const bool return_events = optional_bool(params, "return_stream_event", false);
  record.timestamp_ms = now_ms();

  Response r;
  storage::TableSchema table;
  auto out = store_.UpdateItem(spec, &table);
  adopt_table(record, table);
  record.success = out.IsSuccess();
  if (!out.IsSuccess()) {
    record.error = out.GetError();
    return Finish(record, std::move(r), false);
  }

  const storage::Mutation& m = out.GetResult();
  record.item_count = 1;
  record.written_item_bytes.push_back(m.size_bytes);
  record.mutations.push_back(m);

  JsonValue data;
  data.WithObject("item", storage::ItemToJson(*m.new_image));
  data.WithBool("created", m.kind == storage::MutationKind::Insert);
  r.data = std::move(data);
  return Finish(record, std::move(r), return_events);
}

Response ToolDispatcher::DeleteItem(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::DeleteItem;
  record.key_based = true;
  record.table_name = require_string(params, "table_name");
  const storage::Item key = require_item(params, "key");
  const bool return_events = optional_bool(params, "return_stream_event", false);
  record.timestamp_ms = now_ms();

  Response r;
  storage::TableSchema table;
  auto out = store_.DeleteItem(record.table_name, key, &table);
  adopt_table(record, table);
  record.success = out.IsSuccess();
  if (!out.IsSuccess()) {
    record.error = out.GetError();
    return Finish(record, std::move(r), false);
  }

  const std::optional<storage::Mutation>& m = out.GetResult();
  JsonValue data;
  data.WithBool("deleted", m.has_value());
  if (m) {
    record.item_count = 1;
    record.written_item_bytes.push_back(m->size_bytes);
    record.mutations.push_back(*m);
    data.WithObject("item", storage::ItemToJson(*m->old_image));
  } else {
    record.written_item_bytes.push_back(0);
  }
  r.data = std::move(data);
  return Finish(record, std::move(r), return_events);
}

Response ToolDispatcher::Query(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::Query;
  record.key_based = true;
  record.table_name = require_string(params, "table_name");

  storage::QuerySpec spec;
  spec.table_name = record.table_name;
  spec.key_condition = require_string(params, "key_condition");
  spec.filter_expression = optional_string(params, "filter_expression");
  spec.values = parse_values(params);
  spec.names = parse_names(params);
  spec.limit = optional_limit(params);
  spec.scan_forward = optional_bool(params, "scan_forward", true);
  record.timestamp_ms = now_ms();
  record.has_filter = !spec.filter_expression.empty();

  Response r;
  storage::TableSchema table;
  auto out = store_.Query(spec, &table);
  adopt_table(record, table);
  record.success = out.IsSuccess();
  if (!out.IsSuccess()) {
    // Still classify the condition so the optimizer can explain the failure.
    if (record.key_schema) {
      const auto shape = expression::ClassifyKeyCondition(
          spec.key_condition, expression::Bindings{&spec.values, &spec.names}, *record.key_schema);
      record.pins_partition_key = shape.pins_partition_key;
      record.has_sort_key_condition = shape.has_sort_key_condition;
    }
    record.error = out.GetError();
    return Finish(record, std::move(r), false);
  }

  const storage::ReadResult& rr = out.GetResult();
  record.pins_partition_key = true;
  record.has_sort_key_condition = rr.has_sort_key_condition;
  record.partition_item_count = rr.partition_item_count;
  record.item_count = rr.items.size();
  record.scanned_count = rr.scanned_count;
  record.bytes_read = rr.bytes_read;
  record.filter_attributes = rr.filter_attributes;

  JsonValue data = items_json(rr.items);
  data.WithInt64("scanned_count", static_cast<long long>(rr.scanned_count));
  r.data = std::move(data);
  return Finish(record, std::move(r), false);
}

Response ToolDispatcher::Scan(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::Scan;
  record.full_scan = true;
  record.table_name = require_string(params, "table_name");

  storage::ScanSpec spec;
  spec.table_name = record.table_name;
  spec.filter_expression = optional_string(params, "filter_expression");
  spec.values = parse_values(params);
  spec.names = parse_names(params);
  spec.limit = optional_limit(params);
  record.timestamp_ms = now_ms();
  record.has_filter = !spec.filter_expression.empty();

  Response r;
  storage::TableSchema table;
  auto out = store_.Scan(spec, &table);
  adopt_table(record, table);
  record.success = out.IsSuccess();
  if (!out.IsSuccess()) {
    record.error = out.GetError();
    return Finish(record, std::move(r), false);
  }

  const storage::ReadResult& rr = out.GetResult();
  record.item_count = rr.items.size();
  record.scanned_count = rr.scanned_count;
  record.bytes_read = rr.bytes_read;
  record.filter_attributes = rr.filter_attributes;

  JsonValue data = items_json(rr.items);
  data.WithInt64("scanned_count", static_cast<long long>(rr.scanned_count));
  r.data = std::move(data);
  return Finish(record, std::move(r), false);
}

Response ToolDispatcher::BatchWriteItem(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::BatchWriteItem;
  record.key_based = true;
  record.table_name = require_string(params, "table_name");
  const std::vector<storage::Item> items = require_item_list(params, "items", storage::kMaxBatchWriteItems);
  const bool return_events = optional_bool(params, "return_stream_event", false);
  record.timestamp_ms = now_ms();

  Response r;
  storage::TableSchema table;
  auto out = store_.BatchWriteItem(record.table_name, items, &table);
  adopt_table(record, table);
  record.success = out.IsSuccess();
  if (!out.IsSuccess()) {
    record.error = out.GetError();
    return Finish(record, std::move(r), false);
  }

  const auto& entries = out.GetResult();
  record.item_count = entries.size();
  Array<JsonValue> results(entries.size());
  long long processed = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& e = entries[i];
    JsonValue entry;
    entry.WithInt64("index", static_cast<long long>(i));
    entry.WithBool("success", e.success);
    if (e.success) {
      ++processed;
      record.written_item_bytes.push_back(e.mutation->size_bytes);
      record.mutations.push_back(*e.mutation);
      entry.WithBool("replaced", e.mutation->kind == storage::MutationKind::Modify);
      results[i] = std::move(entry);
    } else {
      record.written_item_bytes.push_back(0);
      results[i] = error_json(std::move(entry), e.error);
    }
  }

  JsonValue data;
  data.WithArray("results", std::move(results));
  data.WithInt64("processed", processed);
  data.WithInt64("failed", static_cast<long long>(entries.size()) - processed);
  r.data = std::move(data);
  return Finish(record, std::move(r), return_events);
}

Response ToolDispatcher::BatchGetItem(JsonView params) {
  OperationRecord record;
  record.kind = OperationKind::BatchGetItem;
  record.key_based = true;
  record.table_name = require_string(params, "table_name");
  const std::vector<storage::Item> keys = require_item_list(params, "keys", storage::kMaxBatchGetKeys);
  record.timestamp_ms = now_ms();

  Response r;
  storage::TableSchema table;
  auto out = store_.BatchGetItem(record.table_name, keys, &table);
  adopt_table(record, table);
  record.success = out.IsSuccess();
  if (!out.IsSuccess()) {
    record.error = out.GetError();
    return Finish(record, std::move(r), false);
  }

  const auto& entries = out.GetResult();
  record.item_count = entries.size();
  Array<JsonValue> results(entries.size());
  long long found = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& e = entries[i];
    JsonValue entry;
    entry.WithInt64("index", static_cast<long long>(i));
    entry.WithBool("success", e.success);
    if (!e.success) {
      record.read_item_bytes.push_back(0);
      entry.WithBool("found", false);
      results[i] = error_json(std::move(entry), e.error);
      continue;
    }
    record.read_item_bytes.push_back(e.result.bytes_read);
    record.bytes_read += e.result.bytes_read;
    entry.WithBool("found", e.result.item.has_value());
    if (e.result.item) {
      ++found;
      entry.WithObject("item", storage::ItemToJson(*e.result.item));
    }
    results[i] = std::move(entry);
  }
  record.scanned_count = static_cast<size_t>(found);

  JsonValue data;
  data.WithArray("results", std::move(results));
  data.WithInt64("count", found);
  r.data = std::move(data);
  return Finish(record, std::move(r), false);
}

analysis::LedgerSummary ToolDispatcher::GetLedgerSummary() const {
  return accountant_.Summary();
}

void ToolDispatcher::ResetLedger() {
  accountant_.Reset();
  std::cout << "[op] ledger reset" << std::endl;
}

analysis::IndexSuggestion ToolDispatcher::GetAdvisories(const std::string& table_name) const {
  return index_advisor_.Suggestion(table_name);
}

std::vector<analysis::StreamEvent> ToolDispatcher::RecentStreamEvents(const std::string& table_name,
                                                                      size_t k) const {
  return streams_.Recent(table_name, k);
}

void ToolDispatcher::Log(const std::string& tool_name, const Response& r) const {
  if (!options_.log_operations) return;
  if (r.success) {
    std::cout << "[op] " << tool_name << " ok cost=" << r.cost << " rcu=" << r.capacity.rcu
              << " wcu=" << r.capacity.wcu << " advisories=" << r.advisories.size() << std::endl;
  } else {
    std::cerr << "[op] " << tool_name << " failed cost=" << r.cost << " error=" << r.error.value_or("")
              << std::endl;
  }
}

}  // namespace dispatch
