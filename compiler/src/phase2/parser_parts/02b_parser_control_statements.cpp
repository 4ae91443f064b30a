// Control-flow statements:
// - if/elif/else (an elif chain nests into the else branch)
// - for-in loops

#include "minipy/parser.h"

namespace minipy {

StmtPtr Parser::parse_if_statement(int indent, const std::string& line, std::size_t keyword_len) {
  const auto line_no = lines[index].line_no;
  const std::string line_text = line;
  const auto colon = find_header_colon(line_text);
  auto header = trim_static(line_text.substr(keyword_len, colon - keyword_len));
  if (header.empty()) {
    throw parse_error(line_no, "empty if condition", line_text);
  }

  auto cond = parse_expression(header);
  auto then_body = parse_suite(indent, colon, "if");

  StmtList else_body;
  if (index < lines.size() && lines[index].indent == indent) {
    const std::string next = lines[index].text;
    if (is_block_header(next, "elif")) {
      else_body.push_back(parse_if_statement(indent, next, 4));
    } else if (is_else_header(next)) {
      else_body = parse_suite(indent, find_header_colon(next), "else");
    }
  }
  return std::make_unique<IfStmt>(std::move(cond), std::move(then_body), std::move(else_body));
}

StmtPtr Parser::parse_for_statement(int indent, const std::string& line) {
  const auto line_no = lines[index].line_no;
  const std::string line_text = line;
  const auto colon = find_header_colon(line_text);
  auto header = trim_static(line_text.substr(3, colon - 3));
  const auto in_pos = header.find(" in ");
  if (in_pos == std::string::npos) {
    throw parse_error(line_no, "missing 'in' in for statement", line_text);
  }

  const auto var_name = trim_static(header.substr(0, in_pos));
  if (!is_identifier_token(var_name)) {
    throw parse_error(line_no, "invalid loop variable", line_text);
  }

  const auto iterable_src = trim_static(header.substr(in_pos + 4));
  if (iterable_src.empty()) {
    throw parse_error(line_no, "empty for iterable", line_text);
  }
  auto iterable = parse_expression(iterable_src);
  auto body = parse_suite(indent, colon, "for");
  return std::make_unique<ForStmt>(var_name, std::move(iterable), std::move(body));
}

}  // namespace minipy
