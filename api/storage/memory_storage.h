#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "storage.h"

namespace storage {

// In-process table store. Each table has its own lock; the catalog lock is
// held only for lookups and create/delete.
class MemoryStorage : public IStorage {
 public:
  MemoryStorage() = default;
  MemoryStorage(const MemoryStorage&) = delete;
  MemoryStorage& operator=(const MemoryStorage&) = delete;

  StoreOutcome<TableDescription> CreateTable(const std::string& table_name,
                                             const KeySchema& key_schema,
                                             BillingMode billing_mode) override;
  StoreOutcome<TableDescription> DescribeTable(const std::string& table_name) override;
  StoreOutcome<TableDescription> DeleteTable(const std::string& table_name) override;
  std::vector<std::string> ListTables() override;

  StoreOutcome<Mutation> PutItem(const std::string& table_name, const Item& item,
                                 TableSchema* table = nullptr) override;
  StoreOutcome<GetResult> GetItem(const std::string& table_name, const Item& key,
                                  TableSchema* table = nullptr) override;
  StoreOutcome<Mutation> UpdateItem(const UpdateSpec& spec, TableSchema* table = nullptr) override;
  StoreOutcome<std::optional<Mutation>> DeleteItem(const std::string& table_name, const Item& key,
                                                   TableSchema* table = nullptr) override;

  StoreOutcome<ReadResult> Query(const QuerySpec& spec, TableSchema* table = nullptr) override;
  StoreOutcome<ReadResult> Scan(const ScanSpec& spec, TableSchema* table = nullptr) override;

  StoreOutcome<std::vector<BatchWriteEntry>> BatchWriteItem(const std::string& table_name,
                                                            const std::vector<Item>& items,
                                                            TableSchema* table = nullptr) override;
  StoreOutcome<std::vector<BatchGetEntry>> BatchGetItem(const std::string& table_name,
                                                        const std::vector<Item>& keys,
                                                        TableSchema* table = nullptr) override;

 private:
  struct Table {
    TableDescription desc;
    std::map<std::string, Item> items;  // encoded key -> item
    size_t size_bytes = 0;              // sum of ItemSizeBytes over items
    // Shared with later tables of the same name so sequence numbers survive
    // delete/recreate.
    std::shared_ptr<std::atomic<uint64_t>> sequence;
    std::mutex mu;
  };

  struct ExtractedKey {
    std::string encoded;
    Item keys;
  };

  // Looks the table up and reports its schema into `schema` when given.
  std::shared_ptr<Table> FindTable(const std::string& table_name, TableSchema* schema = nullptr) const;
  static TableDescription DescribeLocked(const Table& t);

  // exact: the input must hold only key attributes (get/update/delete keys).
  static StoreOutcome<ExtractedKey> ExtractKey(const KeySchema& schema, const Item& item, bool exact);

  static Mutation PutLocked(Table& t, const Item& item, const ExtractedKey& key);
  static GetResult GetLocked(const Table& t, const ExtractedKey& key);

  mutable std::mutex catalog_mu_;
  std::map<std::string, std::shared_ptr<Table>> tables_;
  std::map<std::string, std::shared_ptr<std::atomic<uint64_t>>> sequences_;
};

}  // namespace storage
