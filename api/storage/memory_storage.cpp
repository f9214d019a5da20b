#include "memory_storage.h"

#include <algorithm>
#include <chrono>

#include "../expression/evaluator.h"
#include "../expression/key_condition.h"
#include "../expression/parser.h"
#include "attribute_value.h"

namespace storage {
namespace {

int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// <tag><byte length>:<bytes>. The length prefix keeps part boundaries
// unambiguous whatever bytes a string key holds.
void append_key_part(std::string& out, const AttributeValue& v) {
  const std::string body = IsNumber(v) ? FormatNumber(std::get<double>(v)) : std::get<std::string>(v);
  out += IsNumber(v) ? 'N' : 'S';
  out += std::to_string(body.size());
  out += ':';
  out += body;
}

std::vector<std::string> key_names(const KeySchema& schema) {
  std::vector<std::string> names{schema.partition_key};
  if (schema.sort_key) names.push_back(*schema.sort_key);
  return names;
}

StoreError not_found(const std::string& table_name) {
  return StoreError(ErrorCode::NotFound, "table " + table_name + " does not exist");
}

// Shared filter/limit pass for query and scan over already ordered candidates.
void collect(const std::vector<const Item*>& candidates,
             const std::optional<expression::Condition>& filter,
             const std::optional<size_t>& limit,
             ReadResult& out) {
  for (const Item* item : candidates) {
    if (limit && out.items.size() >= *limit) break;
    ++out.scanned_count;
    out.bytes_read += ItemSizeBytes(*item);
    if (filter && !expression::Evaluate(*filter, *item)) continue;
    out.items.push_back(*item);
  }
}

}  // namespace

std::shared_ptr<MemoryStorage::Table> MemoryStorage::FindTable(const std::string& table_name,
                                                              TableSchema* schema) const {
  std::shared_ptr<Table> t;
  {
    std::lock_guard<std::mutex> lock(catalog_mu_);
    auto it = tables_.find(table_name);
    if (it == tables_.end()) return nullptr;
    t = it->second;
  }
  // desc never changes after creation.
  if (schema) *schema = TableSchema{t->desc.table_name, t->desc.key_schema, t->desc.billing_mode};
  return t;
}

TableDescription MemoryStorage::DescribeLocked(const Table& t) {
  TableDescription d = t.desc;
  d.item_count = t.items.size();
  d.size_bytes = t.size_bytes;
  return d;
}

StoreOutcome<MemoryStorage::ExtractedKey> MemoryStorage::ExtractKey(const KeySchema& schema,
                                                                    const Item& item,
                                                                    bool exact) {
  ExtractedKey out;
  for (const auto& name : key_names(schema)) {
    auto it = item.find(name);
    if (it == item.end()) {
      return StoreOutcome<ExtractedKey>(StoreError(ErrorCode::MissingKey, "missing key attribute " + name));
    }
    if (!IsKeyKind(it->second)) {
      return StoreOutcome<ExtractedKey>(StoreError(
          ErrorCode::MissingKey, "key attribute " + name + " must be S or N, got " + KindName(it->second)));
    }
    append_key_part(out.encoded, it->second);
    out.keys.emplace(name, it->second);
  }
  if (exact && item.size() != out.keys.size()) {
    for (const auto& kv : item) {
      if (out.keys.count(kv.first) == 0) {
        return StoreOutcome<ExtractedKey>(
            StoreError(ErrorCode::InvalidParameters, "key contains non-key attribute " + kv.first));
      }
    }
  }
  return StoreOutcome<ExtractedKey>(std::move(out));
}

Mutation MemoryStorage::PutLocked(Table& t, const Item& item, const ExtractedKey& key) {
  Mutation m;
  m.table_name = t.desc.table_name;
  m.keys = key.keys;
  m.new_image = item;
  m.size_bytes = ItemSizeBytes(item);

  auto it = t.items.find(key.encoded);
  if (it == t.items.end()) {
    m.kind = MutationKind::Insert;
    t.items.emplace(key.encoded, item);
  } else {
    m.kind = MutationKind::Modify;
    t.size_bytes -= ItemSizeBytes(it->second);
    m.old_image = std::move(it->second);
    it->second = item;
  }
  t.size_bytes += m.size_bytes;
  m.sequence = ++*t.sequence;
  return m;
}

GetResult MemoryStorage::GetLocked(const Table& t, const ExtractedKey& key) {
  GetResult r;
  auto it = t.items.find(key.encoded);
  if (it != t.items.end()) {
    r.item = it->second;
    r.bytes_read = ItemSizeBytes(it->second);
  }
  return r;
}

StoreOutcome<TableDescription> MemoryStorage::CreateTable(const std::string& table_name,
                                                          const KeySchema& key_schema,
                                                          BillingMode billing_mode) {
  if (table_name.empty()) {
    return StoreOutcome<TableDescription>(StoreError(ErrorCode::InvalidSchema, "table name must not be empty"));
  }
  if (key_schema.partition_key.empty()) {
    return StoreOutcome<TableDescription>(
        StoreError(ErrorCode::InvalidSchema, "key schema must name a partition key"));
  }
  if (key_schema.sort_key && key_schema.sort_key->empty()) {
    return StoreOutcome<TableDescription>(StoreError(ErrorCode::InvalidSchema, "sort key name must not be empty"));
  }
  if (key_schema.sort_key && *key_schema.sort_key == key_schema.partition_key) {
    return StoreOutcome<TableDescription>(
        StoreError(ErrorCode::InvalidSchema, "partition key and sort key must be different attributes"));
  }

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (tables_.count(table_name) > 0) {
    return StoreOutcome<TableDescription>(
        StoreError(ErrorCode::AlreadyExists, "table " + table_name + " already exists"));
  }

  auto& seq = sequences_[table_name];
  if (!seq) seq = std::make_shared<std::atomic<uint64_t>>(0);

  auto t = std::make_shared<Table>();
  t->desc.table_name = table_name;
  t->desc.key_schema = key_schema;
  t->desc.billing_mode = billing_mode;
  t->desc.created_at = now_ms();
  t->sequence = seq;
  tables_.emplace(table_name, t);
  return StoreOutcome<TableDescription>(t->desc);
}

StoreOutcome<TableDescription> MemoryStorage::DescribeTable(const std::string& table_name) {
  auto t = FindTable(table_name);
  if (!t) return StoreOutcome<TableDescription>(not_found(table_name));
  std::lock_guard<std::mutex> lock(t->mu);
  return StoreOutcome<TableDescription>(DescribeLocked(*t));
}

StoreOutcome<TableDescription> MemoryStorage::DeleteTable(const std::string& table_name) {
  std::shared_ptr<Table> t;
  {
    std::lock_guard<std::mutex> lock(catalog_mu_);
    auto it = tables_.find(table_name);
    if (it == tables_.end()) return StoreOutcome<TableDescription>(not_found(table_name));
    t = it->second;
    tables_.erase(it);
  }
  std::lock_guard<std::mutex> lock(t->mu);
  return StoreOutcome<TableDescription>(DescribeLocked(*t));
}

std::vector<std::string> MemoryStorage::ListTables() {
  std::lock_guard<std::mutex> lock(catalog_mu_);
  std::vector<std::string> out;
  out.reserve(tables_.size());
  for (const auto& kv : tables_) out.push_back(kv.first);
  return out;
}

StoreOutcome<Mutation> MemoryStorage::PutItem(const std::string& table_name, const Item& item,
                                              TableSchema* table) {
  auto t = FindTable(table_name, table);
  if (!t) return StoreOutcome<Mutation>(not_found(table_name));

  auto key = ExtractKey(t->desc.key_schema, item, false);
  if (!key.IsSuccess()) return StoreOutcome<Mutation>(key.GetError());

  std::lock_guard<std::mutex> lock(t->mu);
  return StoreOutcome<Mutation>(PutLocked(*t, item, key.GetResult()));
}

StoreOutcome<GetResult> MemoryStorage::GetItem(const std::string& table_name, const Item& key,
                                               TableSchema* table) {
  auto t = FindTable(table_name, table);
  if (!t) return StoreOutcome<GetResult>(not_found(table_name));

  auto k = ExtractKey(t->desc.key_schema, key, true);
  if (!k.IsSuccess()) return StoreOutcome<GetResult>(k.GetError());

  std::lock_guard<std::mutex> lock(t->mu);
  return StoreOutcome<GetResult>(GetLocked(*t, k.GetResult()));
}

StoreOutcome<Mutation> MemoryStorage::UpdateItem(const UpdateSpec& spec, TableSchema* table) {
  auto t = FindTable(spec.table_name, table);
  if (!t) return StoreOutcome<Mutation>(not_found(spec.table_name));

  auto k = ExtractKey(t->desc.key_schema, spec.key, true);
  if (!k.IsSuccess()) return StoreOutcome<Mutation>(k.GetError());
  const ExtractedKey& key = k.GetResult();

  expression::UpdateExpression update;
  try {
    update = expression::ParseUpdate(spec.update_expression, expression::Bindings{&spec.values, &spec.names});
  } catch (const expression::ExpressionError& e) {
    return StoreOutcome<Mutation>(StoreError(ErrorCode::InvalidExpression, e.what()));
  }

  // Read-modify-write under the table lock.
  std::lock_guard<std::mutex> lock(t->mu);
  auto it = t->items.find(key.encoded);
  const bool existed = it != t->items.end();

  Item updated;
  try {
    updated = expression::ApplyUpdate(update, existed ? it->second : key.keys, key_names(t->desc.key_schema));
  } catch (const expression::ExpressionError& e) {
    return StoreOutcome<Mutation>(StoreError(ErrorCode::InvalidExpression, e.what()));
  }

  Mutation m;
  m.table_name = t->desc.table_name;
  m.keys = key.keys;
  m.new_image = updated;
  m.size_bytes = ItemSizeBytes(updated);
  if (existed) {
    m.kind = MutationKind::Modify;
    t->size_bytes -= ItemSizeBytes(it->second);
    m.old_image = std::move(it->second);
    it->second = std::move(updated);
  } else {
    m.kind = MutationKind::Insert;
    t->items.emplace(key.encoded, std::move(updated));
  }
  t->size_bytes += m.size_bytes;
  m.sequence = ++*t->sequence;
  return StoreOutcome<Mutation>(std::move(m));
}

StoreOutcome<std::optional<Mutation>> MemoryStorage::DeleteItem(const std::string& table_name, const Item& key,
                                                                TableSchema* table) {
  using Out = StoreOutcome<std::optional<Mutation>>;
  auto t = FindTable(table_name, table);
  if (!t) return Out(not_found(table_name));

  auto k = ExtractKey(t->desc.key_schema, key, true);
  if (!k.IsSuccess()) return Out(k.GetError());

  std::lock_guard<std::mutex> lock(t->mu);
  auto it = t->items.find(k.GetResult().encoded);
  if (it == t->items.end()) return Out(std::optional<Mutation>());

  Mutation m;
  m.kind = MutationKind::Remove;
  m.table_name = t->desc.table_name;
  m.keys = k.GetResult().keys;
  m.size_bytes = ItemSizeBytes(it->second);
  t->size_bytes -= m.size_bytes;
  m.old_image = std::move(it->second);
  t->items.erase(it);
  m.sequence = ++*t->sequence;
  return Out(std::optional<Mutation>(std::move(m)));
}

StoreOutcome<ReadResult> MemoryStorage::Query(const QuerySpec& spec, TableSchema* table) {
  auto t = FindTable(spec.table_name, table);
  if (!t) return StoreOutcome<ReadResult>(not_found(spec.table_name));
  const KeySchema& schema = t->desc.key_schema;
  const expression::Bindings bindings{&spec.values, &spec.names};

  expression::KeyConditionPlan plan;
  std::optional<expression::Condition> filter;
  ReadResult out;
  try {
    plan = expression::PlanKeyCondition(expression::ParseCondition(spec.key_condition, bindings), schema);
    if (!spec.filter_expression.empty()) {
      filter = expression::ParseCondition(spec.filter_expression, bindings);
      out.has_filter = true;
      out.filter_attributes = expression::ReferencedAttributes(*filter);
    }
  } catch (const expression::ExpressionError& e) {
    return StoreOutcome<ReadResult>(StoreError(ErrorCode::InvalidExpression, e.what()));
  }
  out.has_sort_key_condition = plan.sort_condition.has_value();

  std::lock_guard<std::mutex> lock(t->mu);
  std::vector<const Item*> partition;
  for (const auto& kv : t->items) {
    auto pk = kv.second.find(schema.partition_key);
    if (pk != kv.second.end() && Equals(pk->second, plan.partition_value)) partition.push_back(&kv.second);
  }
  out.partition_item_count = partition.size();

  try {
    std::vector<const Item*> matched;
    for (const Item* item : partition) {
      if (!plan.sort_condition || expression::Evaluate(*plan.sort_condition, *item)) matched.push_back(item);
    }
    if (schema.sort_key) {
      const std::string& sk = *schema.sort_key;
      std::stable_sort(matched.begin(), matched.end(), [&](const Item* a, const Item* b) {
        return Compare(a->at(sk), b->at(sk)) < 0;
      });
    }
    if (!spec.scan_forward) std::reverse(matched.begin(), matched.end());
    collect(matched, filter, spec.limit, out);
  } catch (const expression::ExpressionError& e) {
    return StoreOutcome<ReadResult>(StoreError(ErrorCode::InvalidExpression, e.what()));
  }
  return StoreOutcome<ReadResult>(std::move(out));
}

StoreOutcome<ReadResult> MemoryStorage::Scan(const ScanSpec& spec, TableSchema* table) {
  auto t = FindTable(spec.table_name, table);
  if (!t) return StoreOutcome<ReadResult>(not_found(spec.table_name));

  std::optional<expression::Condition> filter;
  ReadResult out;
  try {
    if (!spec.filter_expression.empty()) {
      filter = expression::ParseCondition(spec.filter_expression, expression::Bindings{&spec.values, &spec.names});
      out.has_filter = true;
      out.filter_attributes = expression::ReferencedAttributes(*filter);
    }
  } catch (const expression::ExpressionError& e) {
    return StoreOutcome<ReadResult>(StoreError(ErrorCode::InvalidExpression, e.what()));
  }

  std::lock_guard<std::mutex> lock(t->mu);
  std::vector<const Item*> all;
  all.reserve(t->items.size());
  for (const auto& kv : t->items) all.push_back(&kv.second);

  try {
    collect(all, filter, spec.limit, out);
  } catch (const expression::ExpressionError& e) {
    return StoreOutcome<ReadResult>(StoreError(ErrorCode::InvalidExpression, e.what()));
  }
  return StoreOutcome<ReadResult>(std::move(out));
}

StoreOutcome<std::vector<BatchWriteEntry>> MemoryStorage::BatchWriteItem(const std::string& table_name,
                                                                         const std::vector<Item>& items,
                                                                         TableSchema* table) {
  using Out = StoreOutcome<std::vector<BatchWriteEntry>>;
  auto t = FindTable(table_name, table);
  if (!t) return Out(not_found(table_name));
  if (items.size() > kMaxBatchWriteItems) {
    return Out(StoreError(ErrorCode::InvalidParameters,
                          "batch_write_item accepts at most " + std::to_string(kMaxBatchWriteItems) + " items"));
  }

  std::vector<BatchWriteEntry> entries(items.size());
  std::lock_guard<std::mutex> lock(t->mu);
  for (size_t i = 0; i < items.size(); ++i) {
    auto key = ExtractKey(t->desc.key_schema, items[i], false);
    if (!key.IsSuccess()) {
      entries[i].error = key.GetError();
      continue;
    }
    entries[i].success = true;
    entries[i].mutation = PutLocked(*t, items[i], key.GetResult());
  }
  return Out(std::move(entries));
}

StoreOutcome<std::vector<BatchGetEntry>> MemoryStorage::BatchGetItem(const std::string& table_name,
                                                                     const std::vector<Item>& keys,
                                                                     TableSchema* table) {
  using Out = StoreOutcome<std::vector<BatchGetEntry>>;
  auto t = FindTable(table_name, table);
  if (!t) return Out(not_found(table_name));
  if (keys.size() > kMaxBatchGetKeys) {
    return Out(StoreError(ErrorCode::InvalidParameters,
                          "batch_get_item accepts at most " + std::to_string(kMaxBatchGetKeys) + " keys"));
  }

  std::vector<BatchGetEntry> entries(keys.size());
  std::lock_guard<std::mutex> lock(t->mu);
  for (size_t i = 0; i < keys.size(); ++i) {
    auto key = ExtractKey(t->desc.key_schema, keys[i], true);
    if (!key.IsSuccess()) {
      entries[i].error = key.GetError();
      continue;
    }
    entries[i].success = true;
    entries[i].result = GetLocked(*t, key.GetResult());
  }
  return Out(std::move(entries));
}

}  // namespace storage
