#include "operation_record.h"

namespace analysis {
namespace {

struct KindEntry {
  OperationKind kind;
  const char* name;
};

constexpr KindEntry kKinds[] = {
    {OperationKind::CreateTable, "create_table"},
    {OperationKind::DescribeTable, "describe_table"},
    {OperationKind::DeleteTable, "delete_table"},
    {OperationKind::PutItem, "put_item"},
    {OperationKind::GetItem, "get_item"},
    {OperationKind::UpdateItem, "update_item"},
    {OperationKind::DeleteItem, "delete_item"},
    {OperationKind::Query, "query"},
    {OperationKind::Scan, "scan"},
    {OperationKind::BatchWriteItem, "batch_write_item"},
    {OperationKind::BatchGetItem, "batch_get_item"},
};

}  // namespace

const char* OperationKindName(OperationKind kind) {
  for (const auto& e : kKinds) {
    if (e.kind == kind) return e.name;
  }
  return "unknown";
}

std::optional<OperationKind> OperationKindFromName(const std::string& name) {
  for (const auto& e : kKinds) {
    if (name == e.name) return e.kind;
  }
  return std::nullopt;
}

bool IsReadOperation(OperationKind kind) {
  return kind == OperationKind::GetItem || kind == OperationKind::Query || kind == OperationKind::Scan ||
         kind == OperationKind::BatchGetItem;
}

bool IsWriteOperation(OperationKind kind) {
  return kind == OperationKind::PutItem || kind == OperationKind::UpdateItem ||
         kind == OperationKind::DeleteItem || kind == OperationKind::BatchWriteItem;
}

bool IsTableOperation(OperationKind kind) {
  return kind == OperationKind::CreateTable || kind == OperationKind::DescribeTable ||
         kind == OperationKind::DeleteTable;
}

const char* SeverityName(Severity s) {
  return s == Severity::Warning ? "warning" : "info";
}

}  // namespace analysis
