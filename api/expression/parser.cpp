#include "parser.h"

#include <cctype>
#include <set>
#include <vector>

#include "../storage/attribute_value.h"
#include "tokenizer.h"

namespace expression {
namespace {

bool ieq(const std::string& a, const char* b) {
  std::string rhs(b);
  if (a.size() != rhs.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char ca = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
    char cb = static_cast<char>(std::tolower(static_cast<unsigned char>(rhs[i])));
    if (ca != cb) return false;
  }
  return true;
}

bool is_reserved(const std::string& word) {
  static const char* kReserved[] = {"AND", "BETWEEN", "SET", "REMOVE", "ADD", "OR", "NOT"};
  for (const char* r : kReserved) {
    if (ieq(word, r)) return true;
  }
  return false;
}

Comparator comparator_from(const std::string& text) {
  if (text == "=") return Comparator::Eq;
  if (text == "<>") return Comparator::Ne;
  if (text == "<") return Comparator::Lt;
  if (text == "<=") return Comparator::Le;
  if (text == ">") return Comparator::Gt;
  return Comparator::Ge;
}

class Parser {
 public:
  Parser(const std::string& text, const Bindings& bindings)
      : tokens_(Tokenize(text)), bindings_(bindings) {}

  Condition ParseConditionRoot() {
    if (Peek().type == TokenType::End) throw ExpressionError("empty condition expression");
    Condition c = ParseAnd();
    ExpectEnd();
    return c;
  }

  UpdateExpression ParseUpdateRoot() {
    UpdateExpression out;
    std::set<std::string> seen;
    if (Peek().type == TokenType::End) throw ExpressionError("empty update expression");

    while (Peek().type != TokenType::End) {
      const Token& kw = Next();
      if (kw.type != TokenType::Identifier) {
        throw ExpressionError("expected SET, REMOVE or ADD near '" + kw.text + "'");
      }
      std::string clause;
      if (ieq(kw.text, "SET")) {
        clause = "SET";
      } else if (ieq(kw.text, "REMOVE")) {
        clause = "REMOVE";
      } else if (ieq(kw.text, "ADD")) {
        clause = "ADD";
      } else {
        throw ExpressionError("expected SET, REMOVE or ADD near '" + kw.text + "'");
      }
      if (!seen.insert(clause).second) {
        throw ExpressionError("the " + clause + " clause may appear only once");
      }

      do {
        UpdateAction action;
        action.path = ParsePath();
        if (clause == "SET") {
          action.kind = UpdateAction::Kind::Set;
          const Token& eq = Next();
          if (eq.type != TokenType::Comparator || eq.text != "=") {
            throw ExpressionError("expected '=' after " + action.path + " in SET clause");
          }
          action.value = ParseOperand();
          if (Peek().type == TokenType::Plus || Peek().type == TokenType::Minus) {
            action.arithmetic = Next().type == TokenType::Plus ? '+' : '-';
            action.rhs = ParseOperand();
          }
        } else if (clause == "REMOVE") {
          action.kind = UpdateAction::Kind::Remove;
        } else {
          action.kind = UpdateAction::Kind::Add;
          action.value = ParseOperand();
        }
        out.actions.push_back(std::move(action));
      } while (Accept(TokenType::Comma));
    }
    return out;
  }

 private:
  const Token& Peek() const { return tokens_[pos_]; }

  const Token& Next() {
    const Token& t = tokens_[pos_];
    if (t.type != TokenType::End) ++pos_;
    return t;
  }

  bool Accept(TokenType type) {
    if (Peek().type != type) return false;
    Next();
    return true;
  }

  void Expect(TokenType type, const char* what) {
    if (!Accept(type)) {
      const Token& t = Peek();
      if (type == TokenType::RParen) {
        throw ExpressionError("unbalanced parentheses: expected ')' at offset " + std::to_string(t.offset));
      }
      throw ExpressionError(std::string("expected ") + what + " at offset " + std::to_string(t.offset));
    }
  }

  void ExpectEnd() {
    const Token& t = Peek();
    if (t.type == TokenType::End) return;
    if (t.type == TokenType::RParen) {
      throw ExpressionError("unbalanced parentheses: unexpected ')' at offset " + std::to_string(t.offset));
    }
    throw ExpressionError("unexpected token '" + t.text + "' at offset " + std::to_string(t.offset));
  }

  std::string ResolveName(const Token& t) const {
    if (bindings_.names) {
      auto it = bindings_.names->find(t.text);
      if (it != bindings_.names->end()) return it->second;
    }
    throw ExpressionError("unknown attribute name placeholder " + t.text);
  }

  storage::AttributeValue ResolveValue(const Token& t) const {
    if (bindings_.values) {
      auto it = bindings_.values->find(t.text);
      if (it != bindings_.values->end()) return it->second;
    }
    throw ExpressionError("unknown placeholder " + t.text);
  }

  std::string ParsePath() {
    const Token& t = Next();
    if (t.type == TokenType::NameRef) return ResolveName(t);
    if (t.type == TokenType::Identifier && !is_reserved(t.text)) return t.text;
    throw ExpressionError("expected attribute name at offset " + std::to_string(t.offset));
  }

  Operand ParseOperand() {
    const Token& t = Next();
    switch (t.type) {
      case TokenType::Identifier:
        if (ieq(t.text, "true")) return Operand::Literal(true);
        if (ieq(t.text, "false")) return Operand::Literal(false);
        if (ieq(t.text, "null")) return Operand::Literal(std::monostate{});
        if (is_reserved(t.text)) {
          throw ExpressionError("unexpected keyword " + t.text + " at offset " + std::to_string(t.offset));
        }
        return Operand::Attribute(t.text);
      case TokenType::NameRef:
        return Operand::Attribute(ResolveName(t));
      case TokenType::ValueRef:
        return Operand::Literal(ResolveValue(t));
      case TokenType::String:
        return Operand::Literal(t.text);
      case TokenType::Number:
        return Operand::Literal(ParseNumberToken(t.text, false, t.offset));
      case TokenType::Minus: {
        const Token& num = Next();
        if (num.type != TokenType::Number) {
          throw ExpressionError("expected number after '-' at offset " + std::to_string(t.offset));
        }
        return Operand::Literal(ParseNumberToken(num.text, true, num.offset));
      }
      case TokenType::LParen:
        throw ExpressionError("expected operand at offset " + std::to_string(t.offset));
      case TokenType::End:
        throw ExpressionError("unexpected end of expression");
      default:
        throw ExpressionError("unexpected token '" + t.text + "' at offset " + std::to_string(t.offset));
    }
  }

  static storage::AttributeValue ParseNumberToken(const std::string& text, bool negate, size_t offset) {
    const auto parsed = storage::ParseNumber(text);
    if (!parsed) throw ExpressionError("invalid number at offset " + std::to_string(offset));
    return negate ? -*parsed : *parsed;
  }

  Condition ParseAnd() {
    Condition first = ParsePrimary();
    if (!(Peek().type == TokenType::Identifier && ieq(Peek().text, "AND"))) return first;

    Condition conj;
    conj.kind = Condition::Kind::And;
    conj.children.push_back(std::move(first));
    while (Peek().type == TokenType::Identifier && ieq(Peek().text, "AND")) {
      Next();
      Condition next = ParsePrimary();
      if (next.kind == Condition::Kind::And) {
        for (auto& child : next.children) conj.children.push_back(std::move(child));
      } else {
        conj.children.push_back(std::move(next));
      }
    }
    return conj;
  }

  Condition ParsePrimary() {
    const Token& t = Peek();
    if (t.type == TokenType::Identifier && (ieq(t.text, "OR") || ieq(t.text, "NOT"))) {
      throw ExpressionError("operator " + t.text + " is not supported");
    }

    if (Accept(TokenType::LParen)) {
      Condition inner = ParseAnd();
      Expect(TokenType::RParen, "')'");
      return inner;
    }

    if (t.type == TokenType::Identifier && tokens_[pos_ + 1].type == TokenType::LParen) {
      return ParseFunction();
    }

    Condition c;
    c.operands.push_back(ParseOperand());
    const Token& op = Next();
    if (op.type == TokenType::Comparator) {
      c.kind = Condition::Kind::Compare;
      c.op = comparator_from(op.text);
      c.operands.push_back(ParseOperand());
      return c;
    }
    if (op.type == TokenType::Identifier && ieq(op.text, "BETWEEN")) {
      c.kind = Condition::Kind::Between;
      c.operands.push_back(ParseOperand());
      const Token& conj = Next();
      if (!(conj.type == TokenType::Identifier && ieq(conj.text, "AND"))) {
        throw ExpressionError("expected AND in BETWEEN at offset " + std::to_string(conj.offset));
      }
      c.operands.push_back(ParseOperand());
      return c;
    }
    if (op.type == TokenType::End) throw ExpressionError("expected comparator at end of expression");
    throw ExpressionError("expected comparator near '" + op.text + "' at offset " + std::to_string(op.offset));
  }

  Condition ParseFunction() {
    const Token& name = Next();
    Next();  // '('
    Condition c;
    if (ieq(name.text, "begins_with")) {
      c.kind = Condition::Kind::BeginsWith;
      c.operands.push_back(ParseOperand());
      Expect(TokenType::Comma, "','");
      c.operands.push_back(ParseOperand());
    } else if (ieq(name.text, "attribute_exists") || ieq(name.text, "attribute_not_exists")) {
      c.kind = ieq(name.text, "attribute_exists") ? Condition::Kind::AttributeExists
                                                 : Condition::Kind::AttributeNotExists;
      c.operands.push_back(Operand::Attribute(ParsePath()));
    } else {
      throw ExpressionError("unknown function " + name.text);
    }
    Expect(TokenType::RParen, "')'");
    return c;
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  Bindings bindings_;
};

}  // namespace

const char* ComparatorText(Comparator c) {
  switch (c) {
    case Comparator::Eq: return "=";
    case Comparator::Ne: return "<>";
    case Comparator::Lt: return "<";
    case Comparator::Le: return "<=";
    case Comparator::Gt: return ">";
    case Comparator::Ge: return ">=";
  }
  return "=";
}

Condition ParseCondition(const std::string& text, const Bindings& bindings) {
  Parser p(text, bindings);
  return p.ParseConditionRoot();
}

UpdateExpression ParseUpdate(const std::string& text, const Bindings& bindings) {
  Parser p(text, bindings);
  return p.ParseUpdateRoot();
}

}  // namespace expression
