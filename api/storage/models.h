#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace storage {

// Closed set of scalar kinds an item attribute may hold. Index order is the
// DynamoDB type tag order used by KindName(): NULL, S, N, BOOL.
using AttributeValue = std::variant<std::monostate, std::string, double, bool>;

// Attribute name -> value. Ordered so rendering and key encoding are stable.
using Item = std::map<std::string, AttributeValue>;

enum class BillingMode {
  OnDemand,
  Provisioned,
};

struct KeySchema {
  std::string partition_key;
  std::optional<std::string> sort_key;
};

// Immutable part of a table, reported by data operations so callers judge a
// call against the table that actually served it.
struct TableSchema {
  std::string table_name;  // empty: no table served the call
  KeySchema key_schema;
  BillingMode billing_mode = BillingMode::OnDemand;
};

struct TableDescription {
  std::string table_name;
  KeySchema key_schema;
  BillingMode billing_mode = BillingMode::OnDemand;
  size_t item_count = 0;
  size_t size_bytes = 0;
  int64_t created_at = 0;  // epoch ms
};

enum class MutationKind {
  Insert,
  Modify,
  Remove,
};

// Effective item-level change produced by a write. Sequence numbers are
// allocated under the owning table's lock.
struct Mutation {
  MutationKind kind = MutationKind::Insert;
  std::string table_name;
  Item keys;
  std::optional<Item> new_image;
  std::optional<Item> old_image;
  uint64_t sequence = 0;
  size_t size_bytes = 0;
};

struct ReadResult {
  std::vector<Item> items;
  size_t scanned_count = 0;
  size_t bytes_read = 0;
  bool has_filter = false;
  std::vector<std::string> filter_attributes;  // first-seen order
  bool has_sort_key_condition = false;
  size_t partition_item_count = 0;  // query only
};

struct GetResult {
  std::optional<Item> item;
  size_t bytes_read = 0;
};

}  // namespace storage
