// Statement dispatch entry:
// - chooses statement kind by prefix/shape
// - handles return statements and simple statement forms (print / assignment / expression)

#include "minipy/parser.h"

namespace minipy {

StmtPtr Parser::parse_statement(int indent) {
  if (index >= lines.size()) {
    throw parse_error(-1, "unexpected end of input");
  }

  const auto& line = lines[index].text;
  const auto& line_no = lines[index].line_no;
  const auto& line_text = lines[index].text;

  if (is_block_header(line, "def")) {
    if (indent != 0) {
      throw parse_error(line_no, "function definitions are only allowed at top level", line_text);
    }
    return parse_function_statement(indent, line);
  }
  if (is_block_header(line, "if")) {
    return parse_if_statement(indent, line, 2);
  }
  if (is_block_header(line, "for")) {
    return parse_for_statement(indent, line);
  }
  if (line == "return" || starts_with_keyword(line, "return")) {
    return parse_return_statement(line);
  }
  if (is_else_header(line) || is_block_header(line, "elif")) {
    throw parse_error(line_no, "unexpected clause outside if statement", line_text);
  }

  try {
    return parse_assignment_or_expression(line);
  } catch (const ParseException& err) {
    const std::string msg = err.what();
    if (msg.rfind("line ", 0) == 0) {
      throw;
    }
    throw parse_error(line_no, msg, line_text);
  }
}

StmtPtr Parser::parse_return_statement(const std::string& line) {
  const auto line_no = lines[index].line_no;
  const auto line_text = lines[index].text;
  if (line == "return") {
    throw parse_error(line_no, "return requires a value", line_text);
  }
  auto rhs = parse_expression(trim_static(line.substr(6)));
  ++index;
  return std::make_unique<ReturnStmt>(std::move(rhs));
}

StmtPtr Parser::parse_assignment_or_expression(const std::string& line) {
  std::string lhs;
  std::string rhs;
  if (is_assignment(line, &lhs, &rhs)) {
    auto target = parse_expression(lhs);
    if (!is_assign_target_expr(*target)) {
      throw parse_error(lines[index].line_no, "invalid assignment target", lines[index].text);
    }
    if (target->kind == Expr::Kind::Variable &&
        !is_identifier_token(static_cast<const VariableExpr&>(*target).name)) {
      throw parse_error(lines[index].line_no, "cannot assign to reserved word", lines[index].text);
    }
    auto value = parse_expression(rhs);
    ++index;
    return std::make_unique<AssignStmt>(std::move(target), std::move(value));
  }

  auto value = parse_expression(line);
  if (value->kind == Expr::Kind::Call && static_cast<const CallExpr&>(*value).callee == "print") {
    auto& call = static_cast<CallExpr&>(*value);
    if (call.args.size() != 1) {
      throw parse_error(lines[index].line_no, "print expects exactly one argument", lines[index].text);
    }
    auto printed = std::move(call.args.front());
    ++index;
    return std::make_unique<PrintStmt>(std::move(printed));
  }
  ++index;
  return std::make_unique<ExpressionStmt>(std::move(value));
}

}  // namespace minipy
