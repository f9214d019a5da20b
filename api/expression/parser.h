#pragma once

#include <string>

#include "ast.h"

namespace expression {

// Placeholder bindings consulted while parsing. Every :value and #name the
// expression mentions must be present here.
struct Bindings {
  const Values* values = nullptr;
  const Names* names = nullptr;
};

// Condition grammar:
//   condition := primary (AND primary)*
//   primary   := '(' condition ')'
//              | operand comparator operand
//              | operand BETWEEN operand AND operand
//              | begins_with '(' operand ',' operand ')'
//              | attribute_exists '(' path ')' | attribute_not_exists '(' path ')'
// Throws ExpressionError.
Condition ParseCondition(const std::string& text, const Bindings& bindings);

// SET a = x [+|- y], ... | REMOVE a, ... | ADD a x, ...; each keyword once.
// Throws ExpressionError.
UpdateExpression ParseUpdate(const std::string& text, const Bindings& bindings);

}  // namespace expression
