#include "tokenizer.h"

#include <cctype>

#include "ast.h"

namespace expression {
namespace {

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::vector<Token> Tokenize(const std::string& input) {
  std::vector<Token> out;
  size_t i = 0;
  const size_t n = input.size();

  auto push = [&](TokenType type, std::string text, size_t offset) {
    out.push_back(Token{type, std::move(text), offset});
  };

  while (i < n) {
    const char c = input[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }

    const size_t start = i;
    if (is_ident_start(c)) {
      while (i < n && is_ident_char(input[i])) ++i;
      push(TokenType::Identifier, input.substr(start, i - start), start);
      continue;
    }

    if (c == '#' || c == ':') {
      ++i;
      while (i < n && (std::isalnum(static_cast<unsigned char>(input[i])) || input[i] == '_')) ++i;
      if (i == start + 1) {
        throw ExpressionError(std::string("empty placeholder at offset ") + std::to_string(start));
      }
      push(c == '#' ? TokenType::NameRef : TokenType::ValueRef, input.substr(start, i - start), start);
      continue;
    }

    if (is_digit(c)) {
      while (i < n && is_digit(input[i])) ++i;
      if (i < n && input[i] == '.') {
        ++i;
        while (i < n && is_digit(input[i])) ++i;
      }
      if (i < n && (input[i] == 'e' || input[i] == 'E')) {
        size_t j = i + 1;
        if (j < n && (input[j] == '+' || input[j] == '-')) ++j;
        if (j < n && is_digit(input[j])) {
          i = j;
          while (i < n && is_digit(input[i])) ++i;
        }
      }
      push(TokenType::Number, input.substr(start, i - start), start);
      continue;
    }

    if (c == '\'' || c == '"') {
      ++i;
      std::string text;
      bool closed = false;
      while (i < n) {
        if (input[i] == '\\' && i + 1 < n) {
          text.push_back(input[i + 1]);
          i += 2;
          continue;
        }
        if (input[i] == c) {
          closed = true;
          ++i;
          break;
        }
        text.push_back(input[i]);
        ++i;
      }
      if (!closed) {
        throw ExpressionError("unterminated string literal at offset " + std::to_string(start));
      }
      push(TokenType::String, std::move(text), start);
      continue;
    }

    switch (c) {
      case '(':
        push(TokenType::LParen, "(", start);
        ++i;
        continue;
      case ')':
        push(TokenType::RParen, ")", start);
        ++i;
        continue;
      case ',':
        push(TokenType::Comma, ",", start);
        ++i;
        continue;
      case '+':
        push(TokenType::Plus, "+", start);
        ++i;
        continue;
      case '-':
        push(TokenType::Minus, "-", start);
        ++i;
        continue;
      case '=':
        push(TokenType::Comparator, "=", start);
        ++i;
        continue;
      case '<':
        if (i + 1 < n && input[i + 1] == '=') {
          push(TokenType::Comparator, "<=", start);
          i += 2;
        } else if (i + 1 < n && input[i + 1] == '>') {
          push(TokenType::Comparator, "<>", start);
          i += 2;
        } else {
          push(TokenType::Comparator, "<", start);
          ++i;
        }
        continue;
      case '>':
        if (i + 1 < n && input[i + 1] == '=') {
          push(TokenType::Comparator, ">=", start);
          i += 2;
        } else {
          push(TokenType::Comparator, ">", start);
          ++i;
        }
        continue;
      default:
        break;
    }

    throw ExpressionError(std::string("unexpected character '") + c + "' at offset " + std::to_string(start));
  }

  push(TokenType::End, "", n);
  return out;
}

}  // namespace expression
