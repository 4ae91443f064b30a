// Expression leaf and unary parse:
// - unary minus (`not` is handled by the precedence chain)
// - grouped expressions
// - literals / identifiers / list literal construction

#include <cerrno>
#include <cstdlib>
#include <limits>

#include "minipy/parser.h"

namespace minipy {

namespace {

// Magnitude of INT64_MIN; it only fits when written directly after unary minus.
constexpr const char* kInt64MinDigits = "9223372036854775808";

long long parse_int_literal(const std::string& text) {
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || end == nullptr || *end != '\0') {
    throw parse_error(-1, "integer literal out of range: " + text);
  }
  return value;
}

}  // namespace

ExprPtr Parser::parse_expr_unary(std::vector<ExprToken>& tokens, std::size_t& pos) {
  if (pos < tokens.size() && tokens[pos].type == ExprToken::Type::Operator && tokens[pos].text == "-") {
    ++pos;
    if (pos + 1 < tokens.size() && tokens[pos].type == ExprToken::Type::Number &&
        tokens[pos].text == kInt64MinDigits && tokens[pos + 1].type != ExprToken::Type::LParen &&
        tokens[pos + 1].type != ExprToken::Type::LBracket) {
      ++pos;
      return std::make_unique<IntExpr>(std::numeric_limits<long long>::min(), std::string("-") + kInt64MinDigits);
    }
    return std::make_unique<UnaryExpr>(UnaryOp::Neg, parse_expr_unary(tokens, pos));
  }
  return parse_expr_suffix(tokens, pos);
}

ExprPtr Parser::parse_expr_primary(std::vector<ExprToken>& tokens, std::size_t& pos) {
  if (pos >= tokens.size() || tokens[pos].type == ExprToken::Type::End) {
    throw parse_error(-1, "unexpected end of expression");
  }

  const ExprToken& token = tokens[pos];
  ExprPtr result;

  if (token.type == ExprToken::Type::Number) {
    ++pos;
    result = std::make_unique<IntExpr>(parse_int_literal(token.text), token.text);
  } else if (token.type == ExprToken::Type::String) {
    ++pos;
    result = std::make_unique<StringExpr>(token.text);
  } else if (token.type == ExprToken::Type::Identifier) {
    ++pos;
    if (token.text == "True") {
      result = std::make_unique<BoolExpr>(true);
    } else if (token.text == "False") {
      result = std::make_unique<BoolExpr>(false);
    } else if (token.text == "None") {
      result = std::make_unique<NoneExpr>();
    } else if (token.text == "print" || is_identifier_token(token.text)) {
      result = std::make_unique<VariableExpr>(token.text);
    } else {
      throw parse_error(-1, "unexpected keyword in expression: " + token.text);
    }
  } else if (token.type == ExprToken::Type::LParen) {
    ++pos;
    result = parse_expr_pipe(tokens, pos);
    if (pos >= tokens.size() || tokens[pos].type != ExprToken::Type::RParen) {
      throw parse_error(-1, "missing ) in expression");
    }
    ++pos;
  } else if (token.type == ExprToken::Type::LBracket) {
    ++pos;
    std::vector<ExprPtr> elements;
    if (pos < tokens.size() && tokens[pos].type != ExprToken::Type::RBracket) {
      elements.push_back(parse_expr_pipe(tokens, pos));
      while (pos < tokens.size() && tokens[pos].type == ExprToken::Type::Comma) {
        ++pos;
        elements.push_back(parse_expr_pipe(tokens, pos));
      }
    }
    if (pos >= tokens.size() || tokens[pos].type != ExprToken::Type::RBracket) {
      throw parse_error(-1, "missing ] in list literal");
    }
    ++pos;
    result = std::make_unique<ListExpr>(std::move(elements));
  } else {
    throw parse_error(-1, "invalid token in expression: " + token.text);
  }

  return result;
}

}  // namespace minipy
