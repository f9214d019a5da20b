#include "key_condition.h"

#include <vector>

#include "../storage/attribute_value.h"

namespace expression {
namespace {

void flatten(const Condition& c, std::vector<const Condition*>& out) {
  if (c.kind == Condition::Kind::And) {
    for (const auto& child : c.children) flatten(child, out);
    return;
  }
  out.push_back(&c);
}

// The single attribute a key-condition leaf constrains, or empty if the leaf
// does not have exactly one path operand.
std::string leaf_attribute(const Condition& c) {
  std::string attr;
  for (const auto& o : c.operands) {
    if (o.kind != Operand::Kind::Path) continue;
    if (!attr.empty()) return "";
    attr = o.path;
  }
  return attr;
}

bool is_partition_equality(const Condition& c, const std::string& partition_key) {
  if (c.kind != Condition::Kind::Compare || c.op != Comparator::Eq) return false;
  const auto& a = c.operands[0];
  const auto& b = c.operands[1];
  return (a.kind == Operand::Kind::Path && a.path == partition_key && b.kind == Operand::Kind::Constant) ||
         (b.kind == Operand::Kind::Path && b.path == partition_key && a.kind == Operand::Kind::Constant);
}

}  // namespace

KeyConditionPlan PlanKeyCondition(const Condition& condition, const storage::KeySchema& schema) {
  std::vector<const Condition*> leaves;
  flatten(condition, leaves);

  KeyConditionPlan plan;
  bool have_partition = false;

  for (const Condition* leaf : leaves) {
    const std::string attr = leaf_attribute(*leaf);
    if (attr.empty()) {
      throw ExpressionError("key condition terms must compare one key attribute with a value");
    }

    if (attr == schema.partition_key) {
      if (!is_partition_equality(*leaf, schema.partition_key)) {
        throw ExpressionError("query must pin partition key " + schema.partition_key + " with '='");
      }
      if (have_partition) {
        throw ExpressionError("partition key " + schema.partition_key + " constrained more than once");
      }
      const auto& value_operand =
          leaf->operands[0].kind == Operand::Kind::Constant ? leaf->operands[0] : leaf->operands[1];
      if (!storage::IsKeyKind(value_operand.value)) {
        throw ExpressionError("partition key value must be S or N");
      }
      plan.partition_value = value_operand.value;
      have_partition = true;
      continue;
    }

    if (schema.sort_key && attr == *schema.sort_key) {
      if (plan.sort_condition) {
        throw ExpressionError("sort key " + *schema.sort_key + " constrained more than once");
      }
      const bool allowed = (leaf->kind == Condition::Kind::Compare && leaf->op != Comparator::Ne) ||
                           leaf->kind == Condition::Kind::Between ||
                           leaf->kind == Condition::Kind::BeginsWith;
      if (!allowed) {
        throw ExpressionError("unsupported sort key condition on " + *schema.sort_key);
      }
      plan.sort_condition = *leaf;
      continue;
    }

    throw ExpressionError("key condition may only reference key attributes, found " + attr);
  }

  if (!have_partition) {
    throw ExpressionError("query must pin partition key " + schema.partition_key + " with '='");
  }
  return plan;
}

KeyConditionShape ClassifyKeyCondition(const std::string& text,
                                       const Bindings& bindings,
                                       const storage::KeySchema& schema) {
  KeyConditionShape shape;
  Condition condition;
  try {
    condition = ParseCondition(text, bindings);
  } catch (const ExpressionError&) {
    return shape;
  }
  shape.parsed = true;

  std::vector<const Condition*> leaves;
  flatten(condition, leaves);
  for (const Condition* leaf : leaves) {
    if (is_partition_equality(*leaf, schema.partition_key)) shape.pins_partition_key = true;
    if (schema.sort_key && leaf_attribute(*leaf) == *schema.sort_key) shape.has_sort_key_condition = true;
  }
  return shape;
}

}  // namespace expression
