#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "minipy/ast.h"

namespace minipy {

struct ExprToken {
  enum class Type {
    Identifier,
    Number,
    String,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Comma,
    Operator,
    End,
  };

  Type type;
  std::string text;

  ExprToken(Type t = Type::End, std::string value = "")
      : type(t), text(std::move(value)) {}
};

struct ParseException : public std::runtime_error {
  explicit ParseException(std::string msg) : std::runtime_error(std::move(msg)) {}
};

class Parser {
 public:
  explicit Parser(std::string source_text);

  std::unique_ptr<Program> parse_program();

 private:
  std::string source;

  struct Line {
    int indent;
    int line_no;
    std::string text;
  };

  std::vector<Line> lines;
  std::size_t index = 0;

  void lex_lines();
  int current_indent() const;

  std::vector<StmtPtr> parse_block(int indent);
  std::vector<StmtPtr> parse_suite(int indent, std::size_t colon_pos, const std::string& what);
  StmtPtr parse_statement(int indent);
  StmtPtr parse_if_statement(int indent, const std::string& line, std::size_t keyword_len);
  StmtPtr parse_for_statement(int indent, const std::string& line);
  StmtPtr parse_function_statement(int indent, const std::string& line);
  StmtPtr parse_return_statement(const std::string& line);
  StmtPtr parse_assignment_or_expression(const std::string& line);

  ExprPtr parse_expression(const std::string& text);

  static std::string trim(std::string value);
  static int string_prefix_indent(const std::string& value);
  static std::string strip_comment(std::string value);

  ExprPtr parse_expr_pipe(std::vector<ExprToken>& tokens, std::size_t& pos);
  ExprPtr parse_expr_binary(std::vector<ExprToken>& tokens, std::size_t& pos, int min_precedence);
  ExprPtr parse_expr_unary(std::vector<ExprToken>& tokens, std::size_t& pos);
  ExprPtr parse_expr_primary(std::vector<ExprToken>& tokens, std::size_t& pos);
  ExprPtr parse_expr_suffix(std::vector<ExprToken>& tokens, std::size_t& pos);

  static std::vector<ExprToken> tokenize_expression(const std::string& text, int line_no = -1);
  static int precedence(const std::string& op);

  static bool is_assignment(const std::string& line, std::string* target, std::string* rhs);
};

}  // namespace minipy
