#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../storage/errors.h"
#include "../storage/models.h"

namespace analysis {

enum class OperationKind {
  CreateTable,
  DescribeTable,
  DeleteTable,
  PutItem,
  GetItem,
  UpdateItem,
  DeleteItem,
  Query,
  Scan,
  BatchWriteItem,
  BatchGetItem,
};

// Tool name ("put_item") for a kind.
const char* OperationKindName(OperationKind kind);
std::optional<OperationKind> OperationKindFromName(const std::string& name);

bool IsReadOperation(OperationKind kind);
bool IsWriteOperation(OperationKind kind);
bool IsTableOperation(OperationKind kind);

// One per tool invocation that reached the store. Built by the dispatcher,
// consumed synchronously by the observers and then dropped.
struct OperationRecord {
  std::string table_name;
  OperationKind kind = OperationKind::DescribeTable;
  std::optional<storage::KeySchema> key_schema;  // empty when the table is unknown
  std::optional<storage::BillingMode> billing_mode;
  int64_t timestamp_ms = 0;
  bool success = false;
  storage::StoreError error;

  // Items requested (batch) or affected.
  size_t item_count = 0;
  size_t scanned_count = 0;
  size_t bytes_read = 0;
  std::vector<size_t> read_item_bytes;     // batch_get: one entry per key
  std::vector<size_t> written_item_bytes;  // one entry per written item

  bool key_based = false;
  bool full_scan = false;

  // Query shape.
  bool pins_partition_key = false;
  bool has_sort_key_condition = false;
  size_t partition_item_count = 0;

  bool has_filter = false;
  std::vector<std::string> filter_attributes;

  // Effective mutations in sequence order.
  std::vector<storage::Mutation> mutations;
};

enum class Severity {
  Info,
  Warning,
};

const char* SeverityName(Severity s);

struct Advisory {
  std::string source;
  Severity severity = Severity::Info;
  std::string message;
};

class IObserver {
 public:
  virtual ~IObserver() = default;
  virtual std::vector<Advisory> Observe(const OperationRecord& record) = 0;
};

}  // namespace analysis
