#include <cctype>
#include <stdexcept>

#include "lexer.h"

namespace minipy {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_keyword(const std::string& token) {
  return token == "and" || token == "or" || token == "not";
}

char decode_string_escape(char escape) {
  switch (escape) {
    case 'n':
      return '\n';
    case 'r':
      return '\r';
    case 't':
      return '\t';
    case '\\':
      return '\\';
    case '"':
      return '"';
    case '\'':
      return '\'';
    default:
      return escape;
  }
}

}  // namespace

Lexer::Lexer(std::string text, int line_no) : source(std::move(text)), line_no(line_no) {}

std::vector<ExprToken> Lexer::tokenize() const {
  std::vector<ExprToken> tokens;

  for (std::size_t i = 0; i < source.size();) {
    const char ch = source[i];
    if (is_space(ch)) {
      ++i;
      continue;
    }

    if (std::isalpha(static_cast<unsigned char>(ch)) || ch == '_') {
      std::size_t start = i;
      ++i;
      while (i < source.size() && (std::isalnum(static_cast<unsigned char>(source[i])) || source[i] == '_')) {
        ++i;
      }
      const std::string token = source.substr(start, i - start);
      if (is_keyword(token)) {
        tokens.emplace_back(ExprToken::Type::Operator, token);
      } else {
        tokens.emplace_back(ExprToken::Type::Identifier, token);
      }
      continue;
    }

    if (ch == '"' || ch == '\'') {
      const char quote = ch;
      ++i;
      std::string decoded;
      bool closed = false;
      while (i < source.size()) {
        const char current = source[i++];
        if (current == '\\') {
          if (i >= source.size()) {
            throw ParseException("unterminated string escape");
          }
          decoded.push_back(decode_string_escape(source[i++]));
          continue;
        }
        if (current == quote) {
          closed = true;
          break;
        }
        decoded.push_back(current);
      }
      if (!closed) {
        throw ParseException("unterminated string literal");
      }
      tokens.emplace_back(ExprToken::Type::String, std::move(decoded));
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(ch))) {
      std::size_t start = i;
      ++i;
      while (i < source.size() && std::isdigit(static_cast<unsigned char>(source[i]))) {
        ++i;
      }
      if (i < source.size() && (std::isalpha(static_cast<unsigned char>(source[i])) || source[i] == '_' ||
                                source[i] == '.')) {
        throw ParseException("malformed integer literal: " + source.substr(start, i - start + 1));
      }
      tokens.emplace_back(ExprToken::Type::Number, source.substr(start, i - start));
      continue;
    }

    if (ch == '(') {
      tokens.emplace_back(ExprToken::Type::LParen, "(");
      ++i;
      continue;
    }
    if (ch == ')') {
      tokens.emplace_back(ExprToken::Type::RParen, ")");
      ++i;
      continue;
    }
    if (ch == '[') {
      tokens.emplace_back(ExprToken::Type::LBracket, "[");
      ++i;
      continue;
    }
    if (ch == ']') {
      tokens.emplace_back(ExprToken::Type::RBracket, "]");
      ++i;
      continue;
    }
    if (ch == ',') {
      tokens.emplace_back(ExprToken::Type::Comma, ",");
      ++i;
      continue;
    }

    if ((ch == '=' && i + 1 < source.size() && source[i + 1] == '=') ||
        (ch == '!' && i + 1 < source.size() && source[i + 1] == '=') ||
        (ch == '<' && i + 1 < source.size() && source[i + 1] == '=') ||
        (ch == '>' && i + 1 < source.size() && source[i + 1] == '=')) {
      tokens.emplace_back(ExprToken::Type::Operator, source.substr(i, 2));
      i += 2;
      continue;
    }

    if (ch == '+' || ch == '-' || ch == '*' || ch == '/' || ch == '%' ||
        ch == '<' || ch == '>' || ch == '|') {
      tokens.emplace_back(ExprToken::Type::Operator, std::string(1, ch));
      ++i;
      continue;
    }

    throw ParseException(std::string("unexpected character in expression: '") + ch + "'");
  }

  tokens.emplace_back(ExprToken::Type::End, "");
  return tokens;
}

}  // namespace minipy
