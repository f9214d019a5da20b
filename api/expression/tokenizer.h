#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace expression {

enum class TokenType {
  Identifier,   // attribute name or keyword
  NameRef,      // #name
  ValueRef,     // :name
  String,       // 'text' or "text", quotes stripped
  Number,
  LParen,
  RParen,
  Comma,
  Comparator,   // = <> < <= > >=
  Plus,
  Minus,
  End,
};

struct Token {
  TokenType type = TokenType::End;
  std::string text;
  size_t offset = 0;
};

// Splits an expression into tokens. Throws ExpressionError on an
// unterminated string or a character outside the grammar.
std::vector<Token> Tokenize(const std::string& input);

}  // namespace expression
