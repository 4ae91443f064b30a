// Text helpers shared by the statement and expression parsers.

#include <cctype>
#include <sstream>

#include "minipy/parser.h"

namespace {

bool is_blank_char(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string trim_left_static(std::string_view value) {
  std::size_t i = 0;
  while (i < value.size() && is_blank_char(value[i])) {
    ++i;
  }
  return std::string(value.substr(i));
}

std::string trim_right_static(std::string_view value) {
  std::size_t end = value.size();
  while (end > 0 && is_blank_char(value[end - 1])) {
    --end;
  }
  return std::string(value.substr(0, end));
}

std::string trim_static(std::string_view value) {
  return trim_right_static(trim_left_static(value));
}

// Drops a UTF-8 byte order mark and CR line endings.
std::vector<std::string> split_lines(const std::string& source) {
  std::vector<std::string> output;
  std::istringstream stream(source);
  std::string line;
  bool first = true;
  while (std::getline(stream, line)) {
    if (first && line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
      line.erase(0, 3);
    }
    first = false;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    output.push_back(line);
  }
  return output;
}

// True when `line` is `keyword` followed by whitespace (or `(`, for print).
bool starts_with_keyword(const std::string& line, std::string_view keyword) {
  if (line.size() <= keyword.size() || line.compare(0, keyword.size(), keyword) != 0) {
    return false;
  }
  const char next = line[keyword.size()];
  return std::isspace(static_cast<unsigned char>(next)) || next == '(';
}

// Position of the first ':' outside string literals and brackets, or npos.
std::size_t find_header_colon(const std::string& line) {
  int depth = 0;
  bool in_single = false;
  bool in_double = false;
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
    } else if ((ch == ')' || ch == ']') && depth > 0) {
      --depth;
    } else if (ch == ':' && depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

// Header lines such as `if x:` or `for v in xs: print(v)`.
bool is_block_header(const std::string& line, std::string_view keyword) {
  return starts_with_keyword(line, keyword) && find_header_colon(line) != std::string::npos;
}

// `else:` with an optional inline body.
bool is_else_header(const std::string& line) {
  if (line.rfind("else", 0) != 0) {
    return false;
  }
  const auto rest = trim_left_static(std::string_view(line).substr(4));
  return !rest.empty() && rest.front() == ':';
}

bool is_compound_header(const std::string& line) {
  return is_block_header(line, "def") || is_block_header(line, "if") || is_block_header(line, "elif") ||
         is_block_header(line, "for") || is_else_header(line);
}

}  // namespace

namespace minipy {

std::string Parser::trim(std::string value) {
  return trim_static(value);
}

}  // namespace minipy
