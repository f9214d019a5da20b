#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../storage/models.h"

namespace expression {

// ":name" -> bound value.
using Values = std::map<std::string, storage::AttributeValue>;
// "#name" -> attribute name.
using Names = std::map<std::string, std::string>;

// Any parse or evaluation failure. Callers map it to INVALID_EXPRESSION.
class ExpressionError : public std::runtime_error {
 public:
  explicit ExpressionError(const std::string& what) : std::runtime_error(what) {}
};

// Placeholders are resolved at parse time, so an operand is either an
// attribute path or a constant.
struct Operand {
  enum class Kind { Path, Constant };
  Kind kind = Kind::Constant;
  std::string path;
  storage::AttributeValue value;

  static Operand Attribute(std::string p) {
    Operand o;
    o.kind = Kind::Path;
    o.path = std::move(p);
    return o;
  }
  static Operand Literal(storage::AttributeValue v) {
    Operand o;
    o.kind = Kind::Constant;
    o.value = std::move(v);
    return o;
  }
};

enum class Comparator { Eq, Ne, Lt, Le, Gt, Ge };

const char* ComparatorText(Comparator c);

struct Condition {
  enum class Kind {
    Compare,             // operands[0] op operands[1]
    Between,             // operands[0] BETWEEN operands[1] AND operands[2]
    BeginsWith,          // begins_with(operands[0], operands[1])
    AttributeExists,     // attribute_exists(operands[0])
    AttributeNotExists,  // attribute_not_exists(operands[0])
    And,                 // all children
  };
  Kind kind = Kind::Compare;
  Comparator op = Comparator::Eq;
  std::vector<Operand> operands;
  std::vector<Condition> children;
};

struct UpdateAction {
  enum class Kind { Set, Remove, Add };
  Kind kind = Kind::Set;
  std::string path;
  Operand value;     // SET rhs first term, ADD operand
  char arithmetic = 0;  // '+', '-' or 0 for plain SET
  Operand rhs;       // second term when arithmetic != 0
};

// Actions in textual order; applied left to right.
struct UpdateExpression {
  std::vector<UpdateAction> actions;
};

}  // namespace expression
