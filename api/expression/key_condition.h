#pragma once

#include <optional>
#include <string>

#include "ast.h"
#include "parser.h"

namespace expression {

// A query key condition split into the partition equality and the optional
// sort-key range.
struct KeyConditionPlan {
  storage::AttributeValue partition_value;
  std::optional<Condition> sort_condition;
};

// Validates that the condition pins the partition key with '=' and
// constrains at most the sort key (=, <, <=, >, >=, BETWEEN, begins_with).
// Throws ExpressionError otherwise.
KeyConditionPlan PlanKeyCondition(const Condition& condition, const storage::KeySchema& schema);

struct KeyConditionShape {
  bool parsed = false;
  bool pins_partition_key = false;
  bool has_sort_key_condition = false;
};

// Best-effort classification of a key condition that may not be valid.
// Never throws.
KeyConditionShape ClassifyKeyCondition(const std::string& text,
                                       const Bindings& bindings,
                                       const storage::KeySchema& schema);

}  // namespace expression
