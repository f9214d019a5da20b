#include "evaluator.h"

#include <algorithm>
#include <optional>

#include "../storage/attribute_value.h"

namespace expression {
namespace {

using storage::AttributeValue;

std::optional<AttributeValue> resolve(const Operand& o, const storage::Item& item) {
  if (o.kind == Operand::Kind::Constant) return o.value;
  auto it = item.find(o.path);
  if (it == item.end()) return std::nullopt;
  return it->second;
}

std::string describe(const Operand& o) {
  return o.kind == Operand::Kind::Path ? o.path : storage::ToDisplayString(o.value);
}

void require_same_kind(const AttributeValue& a, const AttributeValue& b, const char* context) {
  if (a.index() != b.index()) {
    throw ExpressionError(std::string("type mismatch in ") + context + ": cannot compare " +
                          storage::KindName(a) + " with " + storage::KindName(b));
  }
}

void require_ordered(const AttributeValue& v, const char* context) {
  if (!storage::IsString(v) && !storage::IsNumber(v)) {
    throw ExpressionError(std::string("type mismatch in ") + context + ": " + storage::KindName(v) +
                          " values are not ordered");
  }
}

bool compare(Comparator op, const AttributeValue& a, const AttributeValue& b) {
  require_same_kind(a, b, ComparatorText(op));
  if (op != Comparator::Eq && op != Comparator::Ne) require_ordered(a, ComparatorText(op));
  const int c = storage::Compare(a, b);
  switch (op) {
    case Comparator::Eq: return c == 0;
    case Comparator::Ne: return c != 0;
    case Comparator::Lt: return c < 0;
    case Comparator::Le: return c <= 0;
    case Comparator::Gt: return c > 0;
    case Comparator::Ge: return c >= 0;
  }
  return false;
}

double require_number(const std::optional<AttributeValue>& v, const Operand& source, const char* context) {
  if (!v) throw ExpressionError(std::string(context) + " operand " + describe(source) + " does not exist");
  if (!storage::IsNumber(*v)) {
    throw ExpressionError(std::string(context) + " requires numbers, got " + storage::KindName(*v) + " for " +
                          describe(source));
  }
  return std::get<double>(*v);
}

void collect_paths(const Condition& c, std::vector<std::string>& out) {
  for (const auto& o : c.operands) {
    if (o.kind != Operand::Kind::Path) continue;
    if (std::find(out.begin(), out.end(), o.path) == out.end()) out.push_back(o.path);
  }
  for (const auto& child : c.children) collect_paths(child, out);
}

}  // namespace

bool Evaluate(const Condition& condition, const storage::Item& item) {
  switch (condition.kind) {
    case Condition::Kind::And:
      for (const auto& child : condition.children) {
        if (!Evaluate(child, item)) return false;
      }
      return true;

    case Condition::Kind::Compare: {
      const auto a = resolve(condition.operands[0], item);
      const auto b = resolve(condition.operands[1], item);
      if (!a || !b) return false;
      return compare(condition.op, *a, *b);
    }

    case Condition::Kind::Between: {
      const auto v = resolve(condition.operands[0], item);
      const auto lo = resolve(condition.operands[1], item);
      const auto hi = resolve(condition.operands[2], item);
      if (!v || !lo || !hi) return false;
      require_same_kind(*v, *lo, "BETWEEN");
      require_same_kind(*v, *hi, "BETWEEN");
      require_ordered(*v, "BETWEEN");
      return storage::Compare(*lo, *v) <= 0 && storage::Compare(*v, *hi) <= 0;
    }

    case Condition::Kind::BeginsWith: {
      const auto v = resolve(condition.operands[0], item);
      const auto prefix = resolve(condition.operands[1], item);
      if (!v || !prefix) return false;
      if (!storage::IsString(*v) || !storage::IsString(*prefix)) {
        throw ExpressionError(std::string("type mismatch in begins_with: expected S, got ") +
                              storage::KindName(*v) + " and " + storage::KindName(*prefix));
      }
      const auto& s = std::get<std::string>(*v);
      const auto& p = std::get<std::string>(*prefix);
      return s.compare(0, p.size(), p) == 0 && s.size() >= p.size();
    }

    case Condition::Kind::AttributeExists:
      return item.count(condition.operands[0].path) > 0;

    case Condition::Kind::AttributeNotExists:
      return item.count(condition.operands[0].path) == 0;
  }
  return false;
}

storage::Item ApplyUpdate(const UpdateExpression& update,
                          storage::Item item,
                          const std::vector<std::string>& protected_attributes) {
  for (const auto& action : update.actions) {
    if (std::find(protected_attributes.begin(), protected_attributes.end(), action.path) !=
        protected_attributes.end()) {
      throw ExpressionError("cannot update key attribute " + action.path);
    }

    switch (action.kind) {
      case UpdateAction::Kind::Set: {
        const auto first = resolve(action.value, item);
        if (action.arithmetic == 0) {
          if (!first) {
            throw ExpressionError("attribute " + describe(action.value) + " referenced in SET does not exist");
          }
          item[action.path] = *first;
          break;
        }
        const double x = require_number(first, action.value, "arithmetic");
        const double y = require_number(resolve(action.rhs, item), action.rhs, "arithmetic");
        item[action.path] = action.arithmetic == '+' ? x + y : x - y;
        break;
      }

      case UpdateAction::Kind::Remove:
        item.erase(action.path);
        break;

      case UpdateAction::Kind::Add: {
        const double delta = require_number(resolve(action.value, item), action.value, "ADD");
        auto it = item.find(action.path);
        if (it == item.end()) {
          item[action.path] = delta;
        } else if (storage::IsNumber(it->second)) {
          it->second = std::get<double>(it->second) + delta;
        } else {
          throw ExpressionError("ADD requires a number attribute, " + action.path + " is " +
                                storage::KindName(it->second));
        }
        break;
      }
    }
  }
  return item;
}

std::vector<std::string> ReferencedAttributes(const Condition& condition) {
  std::vector<std::string> out;
  collect_paths(condition, out);
  return out;
}

}  // namespace expression
