// Parser static helper utilities:
// - parse error construction
// - assignment detection
// - identifier validation
// - indentation/comment helpers

#include <cctype>

#include "minipy/parser.h"

namespace {

minipy::ParseException parse_error(int line_no, const std::string& message, const std::string& line_text = "") {
  if (line_no <= 0) {
    return minipy::ParseException(message);
  }
  std::string prefix = "line " + std::to_string(line_no) + ": " + message;
  if (!line_text.empty()) {
    return minipy::ParseException(prefix + " | " + line_text);
  }
  return minipy::ParseException(prefix);
}

// Only names and single-level element stores can be assigned.
bool is_assign_target_expr(const minipy::Expr& expr) {
  return expr.kind == minipy::Expr::Kind::Variable || expr.kind == minipy::Expr::Kind::Index;
}

bool is_reserved_word(const std::string& token) {
  return token == "def" || token == "if" || token == "elif" || token == "else" || token == "for" ||
         token == "in" || token == "return" || token == "print" || token == "and" || token == "or" ||
         token == "not" || token == "True" || token == "False" || token == "None";
}

bool is_identifier_token(const std::string& token) {
  if (token.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(token[0])) || token[0] == '_')) {
    return false;
  }
  for (std::size_t i = 1; i < token.size(); ++i) {
    if (!(std::isalnum(static_cast<unsigned char>(token[i])) || token[i] == '_')) {
      return false;
    }
  }
  return !is_reserved_word(token);
}

}  // namespace

namespace minipy {

// Tabs count as eight columns so mixed files stay consistent with Python.
int Parser::string_prefix_indent(const std::string& value) {
  int columns = 0;
  for (char c : value) {
    if (c == '\t') {
      columns += 8 - (columns % 8);
      continue;
    }
    if (c == ' ') {
      ++columns;
      continue;
    }
    break;
  }
  return columns;
}

std::string Parser::strip_comment(std::string value) {
  bool in_single = false;
  bool in_double = false;
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    const bool escaped = i > 0 && value[i - 1] == '\\';
    if (!escaped && !in_double && ch == '\'') {
      in_single = !in_single;
      continue;
    }
    if (!escaped && !in_single && ch == '"') {
      in_double = !in_double;
      continue;
    }
    if (!in_single && !in_double && ch == '#') {
      return value.substr(0, i);
    }
  }
  return value;
}

// Finds the first top-level `=` that is not part of `==`, `!=`, `<=` or `>=`.
bool Parser::is_assignment(const std::string& line, std::string* target, std::string* rhs) {
  int depth = 0;
  bool in_single = false;
  bool in_double = false;
  std::size_t equals_pos = std::string::npos;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    const bool escaped = i > 0 && line[i - 1] == '\\';
    if (!escaped && !in_double && ch == '\'') {
      in_single = !in_single;
      continue;
    }
    if (!escaped && !in_single && ch == '"') {
      in_double = !in_double;
      continue;
    }
    if (in_single || in_double) {
      continue;
    }

    if (ch == '(' || ch == '[') {
      ++depth;
      continue;
    }
    if (ch == ')' || ch == ']') {
      if (depth > 0) {
        --depth;
      }
      continue;
    }

    if (ch == '=' && depth == 0) {
      if (i + 1 < line.size() && line[i + 1] == '=') {
        ++i;
        continue;
      }
      if (i > 0 && (line[i - 1] == '<' || line[i - 1] == '>' || line[i - 1] == '!' || line[i - 1] == '=')) {
        continue;
      }
      equals_pos = i;
      break;
    }
  }

  if (equals_pos == std::string::npos) {
    return false;
  }

  const std::string lhs = trim_static(line.substr(0, equals_pos));
  const std::string rhs_text = trim_static(line.substr(equals_pos + 1));
  if (lhs.empty() || rhs_text.empty()) {
    return false;
  }

  *target = lhs;
  *rhs = rhs_text;
  return true;
}

}  // namespace minipy
