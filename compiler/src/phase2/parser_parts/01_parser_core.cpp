// Parser core entry points:
// - parse_program orchestration
// - line splitting and indentation traversal
// - shared block parsing with indentation validation

#include <utility>

#include "minipy/parser.h"

namespace minipy {

Parser::Parser(std::string source_text) : source(std::move(source_text)) {
  lex_lines();
}

std::unique_ptr<Program> Parser::parse_program() {
  index = 0;
  if (!lines.empty() && lines.front().indent != 0) {
    throw parse_error(lines.front().line_no, "unexpected indentation", lines.front().text);
  }
  auto body = parse_block(0);
  if (index != lines.size()) {
    throw parse_error(lines[index].line_no, "unexpected trailing content", lines[index].text);
  }
  return std::make_unique<Program>(Program{std::move(body)});
}

void Parser::lex_lines() {
  lines.clear();
  index = 0;

  const auto raw_lines = split_lines(source);
  for (std::size_t i = 0; i < raw_lines.size(); ++i) {
    auto line = strip_comment(raw_lines[i]);
    line = Parser::trim(line);
    if (line.empty()) {
      continue;
    }
    int indent = string_prefix_indent(raw_lines[i]);
    lines.push_back({indent, static_cast<int>(i + 1), std::move(line)});
  }
}

int Parser::current_indent() const {
  if (index >= lines.size()) {
    return 0;
  }
  return lines[index].indent;
}

std::vector<StmtPtr> Parser::parse_block(int indent) {
  std::vector<StmtPtr> result;
  while (index < lines.size()) {
    int line_indent = current_indent();
    if (line_indent < indent) {
      break;
    }
    if (line_indent > indent) {
      throw parse_error(lines[index].line_no, "unexpected indentation", lines[index].text);
    }
    result.push_back(parse_statement(indent));
  }
  return result;
}

// Body of a compound statement whose header ':' sits at colon_pos of the
// current line: either an inline simple statement or an indented block.
std::vector<StmtPtr> Parser::parse_suite(int indent, std::size_t colon_pos, const std::string& what) {
  const auto header_no = lines[index].line_no;
  const auto header_text = lines[index].text;
  const auto inline_body = trim_static(header_text.substr(colon_pos + 1));
  if (!inline_body.empty()) {
    if (is_compound_header(inline_body)) {
      throw parse_error(header_no, "compound statement cannot follow ':' on the same line", header_text);
    }
    lines[index].text = inline_body;
    std::vector<StmtPtr> body;
    body.push_back(parse_statement(indent + 1));
    return body;
  }

  ++index;
  if (index >= lines.size() || lines[index].indent <= indent) {
    throw parse_error(header_no, what + " body missing indentation", header_text);
  }
  return parse_block(lines[index].indent);
}

}  // namespace minipy
