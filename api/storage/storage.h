#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../expression/ast.h"
#include "errors.h"
#include "models.h"

namespace storage {

// DynamoDB request limits, enforced as structural errors.
constexpr size_t kMaxBatchWriteItems = 25;
constexpr size_t kMaxBatchGetKeys = 100;

struct QuerySpec {
  std::string table_name;
  std::string key_condition;
  std::string filter_expression;  // empty: no filter
  expression::Values values;
  expression::Names names;
  std::optional<size_t> limit;
  bool scan_forward = true;
};

struct ScanSpec {
  std::string table_name;
  std::string filter_expression;
  expression::Values values;
  expression::Names names;
  std::optional<size_t> limit;
};

struct UpdateSpec {
  std::string table_name;
  Item key;
  std::string update_expression;
  expression::Values values;
  expression::Names names;
};

struct BatchWriteEntry {
  bool success = false;
  StoreError error;
  std::optional<Mutation> mutation;
};

struct BatchGetEntry {
  bool success = false;
  StoreError error;
  GetResult result;
};

class IStorage {
 public:
  virtual ~IStorage() = default;

  virtual StoreOutcome<TableDescription> CreateTable(const std::string& table_name,
                                                     const KeySchema& key_schema,
                                                     BillingMode billing_mode) = 0;
  virtual StoreOutcome<TableDescription> DescribeTable(const std::string& table_name) = 0;
  virtual StoreOutcome<TableDescription> DeleteTable(const std::string& table_name) = 0;
  virtual std::vector<std::string> ListTables() = 0;

  // Data operations fill `table` (when given) with the schema of the table
  // that served the call, also when the call then fails on its input.

  // Insert when the key is new (Mutation::kind Insert), replace otherwise
  // (Modify, with the previous item as old_image).
  virtual StoreOutcome<Mutation> PutItem(const std::string& table_name, const Item& item,
                                         TableSchema* table = nullptr) = 0;
  // Absence is a successful result with an empty GetResult::item.
  virtual StoreOutcome<GetResult> GetItem(const std::string& table_name, const Item& key,
                                          TableSchema* table = nullptr) = 0;
  // Upsert: an absent key is created from the key plus the updated attributes.
  virtual StoreOutcome<Mutation> UpdateItem(const UpdateSpec& spec, TableSchema* table = nullptr) = 0;
  // Idempotent; nullopt when no item existed.
  virtual StoreOutcome<std::optional<Mutation>> DeleteItem(const std::string& table_name, const Item& key,
                                                           TableSchema* table = nullptr) = 0;

  virtual StoreOutcome<ReadResult> Query(const QuerySpec& spec, TableSchema* table = nullptr) = 0;
  virtual StoreOutcome<ReadResult> Scan(const ScanSpec& spec, TableSchema* table = nullptr) = 0;

  // Per-element outcomes; the call itself fails only on structural errors.
  virtual StoreOutcome<std::vector<BatchWriteEntry>> BatchWriteItem(const std::string& table_name,
                                                                    const std::vector<Item>& items,
                                                                    TableSchema* table = nullptr) = 0;
  virtual StoreOutcome<std::vector<BatchGetEntry>> BatchGetItem(const std::string& table_name,
                                                                const std::vector<Item>& keys,
                                                                TableSchema* table = nullptr) = 0;
};

}  // namespace storage
