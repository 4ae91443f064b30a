// Expression entry and operator-precedence parsing:
// - pipe chains at the lowest level
// - precedence climbing for binary operators and prefix `not`
// - tokenization via the phase-2 lexer

#include "phase2/lexer.h"
#include "minipy/parser.h"

namespace minipy {

namespace {

// `not` binds looser than comparisons and tighter than `and`.
constexpr int kNotPrecedence = 3;
// Comparisons are non-associative: `a < b < c` is rejected.
constexpr int kComparePrecedence = 4;

}  // namespace

ExprPtr Parser::parse_expression(const std::string& text) {
  const auto line_no = index < lines.size() ? lines[index].line_no : -1;
  const auto line_text = index < lines.size() ? lines[index].text : std::string();
  try {
    auto tokens = tokenize_expression(text, static_cast<int>(line_no));
    std::size_t pos = 0;
    auto expr = parse_expr_pipe(tokens, pos);
    if (pos < tokens.size() && tokens[pos].type != ExprToken::Type::End) {
      throw parse_error(line_no, "unexpected token in expression: " + tokens[pos].text, line_text);
    }
    return expr;
  } catch (const ParseException& err) {
    const std::string message = err.what();
    if (line_no <= 0 || message.rfind("line ", 0) == 0) {
      throw;
    }
    throw parse_error(line_no, message, line_text);
  }
}

std::vector<ExprToken> Parser::tokenize_expression(const std::string& text, int line_no) {
  Lexer lexer(text, line_no);
  return lexer.tokenize();
}

int Parser::precedence(const std::string& op) {
  if (op == "or") return 1;
  if (op == "and") return 2;
  if (op == "==" || op == "!=" || op == "<" || op == ">" || op == "<=" || op == ">=") return kComparePrecedence;
  if (op == "+" || op == "-") return 5;
  if (op == "*" || op == "/" || op == "%") return 6;
  return -1;
}

ExprPtr Parser::parse_expr_pipe(std::vector<ExprToken>& tokens, std::size_t& pos) {
  auto lhs = parse_expr_binary(tokens, pos, 1);
  while (pos < tokens.size() && tokens[pos].type == ExprToken::Type::Operator && tokens[pos].text == "|") {
    ++pos;
    if (pos >= tokens.size() || tokens[pos].type != ExprToken::Type::Identifier ||
        !is_identifier_token(tokens[pos].text)) {
      throw parse_error(-1, "pipe target must be a function name");
    }
    const std::string callee = tokens[pos].text;
    ++pos;
    lhs = std::make_unique<PipeExpr>(std::move(lhs), callee);
  }
  return lhs;
}

ExprPtr Parser::parse_expr_binary(std::vector<ExprToken>& tokens, std::size_t& pos, int min_precedence) {
  ExprPtr lhs;
  if (pos < tokens.size() && tokens[pos].type == ExprToken::Type::Operator && tokens[pos].text == "not") {
    if (min_precedence > kNotPrecedence) {
      throw parse_error(-1, "'not' must be parenthesized here");
    }
    ++pos;
    lhs = std::make_unique<UnaryExpr>(UnaryOp::Not, parse_expr_binary(tokens, pos, kNotPrecedence));
  } else {
    lhs = parse_expr_unary(tokens, pos);
  }

  while (pos < tokens.size()) {
    const auto& token = tokens[pos];
    if (token.type != ExprToken::Type::Operator) {
      break;
    }
    const int p = precedence(token.text);
    if (p < min_precedence || p < 1) {
      break;
    }
    const std::string op_text = token.text;
    ++pos;
    auto rhs = parse_expr_binary(tokens, pos, p + 1);

    BinaryOp op = BinaryOp::Add;
    if (op_text == "+") op = BinaryOp::Add;
    else if (op_text == "-") op = BinaryOp::Sub;
    else if (op_text == "*") op = BinaryOp::Mul;
    else if (op_text == "/") op = BinaryOp::Div;
    else if (op_text == "%") op = BinaryOp::Mod;
    else if (op_text == "==") op = BinaryOp::Eq;
    else if (op_text == "!=") op = BinaryOp::Ne;
    else if (op_text == "<") op = BinaryOp::Lt;
    else if (op_text == "<=") op = BinaryOp::Lte;
    else if (op_text == ">") op = BinaryOp::Gt;
    else if (op_text == ">=") op = BinaryOp::Gte;
    else if (op_text == "and") op = BinaryOp::And;
    else if (op_text == "or") op = BinaryOp::Or;

    lhs = std::make_unique<BinaryExpr>(op, std::move(lhs), std::move(rhs));

    if (p == kComparePrecedence && pos < tokens.size() && tokens[pos].type == ExprToken::Type::Operator &&
        precedence(tokens[pos].text) == kComparePrecedence) {
      throw parse_error(-1, "comparison operators cannot be chained: " + op_text + " " + tokens[pos].text);
    }
  }
  return lhs;
}

}  // namespace minipy
