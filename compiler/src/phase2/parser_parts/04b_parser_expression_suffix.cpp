// Expression suffix parse:
// - calls on plain function names
// - single-index subscript chains

#include "minipy/parser.h"

namespace minipy {

ExprPtr Parser::parse_expr_suffix(std::vector<ExprToken>& tokens, std::size_t& pos) {
  auto result = parse_expr_primary(tokens, pos);
  while (pos < tokens.size()) {
    if (tokens[pos].type == ExprToken::Type::LParen) {
      if (result->kind != Expr::Kind::Variable) {
        throw parse_error(-1, "only named functions can be called");
      }
      ++pos;
      std::vector<ExprPtr> args;
      if (pos < tokens.size() && tokens[pos].type != ExprToken::Type::RParen) {
        args.push_back(parse_expr_pipe(tokens, pos));
        while (pos < tokens.size() && tokens[pos].type == ExprToken::Type::Comma) {
          ++pos;
          args.push_back(parse_expr_pipe(tokens, pos));
        }
      }
      if (pos >= tokens.size() || tokens[pos].type != ExprToken::Type::RParen) {
        throw parse_error(-1, "missing ) in function call");
      }
      ++pos;
      auto callee = static_cast<VariableExpr&>(*result).name;
      result = std::make_unique<CallExpr>(std::move(callee), std::move(args));
      continue;
    }

    if (tokens[pos].type == ExprToken::Type::LBracket) {
      ++pos;
      if (pos >= tokens.size() || tokens[pos].type == ExprToken::Type::RBracket) {
        throw parse_error(-1, "empty index in indexing");
      }
      auto index_expr = parse_expr_pipe(tokens, pos);
      if (pos >= tokens.size() || tokens[pos].type != ExprToken::Type::RBracket) {
        throw parse_error(-1, "missing ] in indexing");
      }
      ++pos;
      result = std::make_unique<IndexExpr>(std::move(result), std::move(index_expr));
      continue;
    }

    break;
  }

  return result;
}

}  // namespace minipy
