#pragma once

#include <string>
#include <vector>

#include "ast.h"

namespace expression {

// Pure evaluation of a condition against an item. A comparison that reads a
// missing attribute is false. Throws ExpressionError on a type mismatch.
bool Evaluate(const Condition& condition, const storage::Item& item);

// Applies the actions left to right to a copy of item; later actions observe
// earlier ones. Actions targeting a protected attribute (the key) throw.
storage::Item ApplyUpdate(const UpdateExpression& update,
                          storage::Item item,
                          const std::vector<std::string>& protected_attributes);

// Attribute paths the condition reads, in first-seen order without repeats.
std::vector<std::string> ReferencedAttributes(const Condition& condition);

}  // namespace expression
