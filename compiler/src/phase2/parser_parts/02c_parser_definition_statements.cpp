// Definition statements:
// - global function definitions with simple comma-separated parameter lists

#include <algorithm>

#include "minipy/parser.h"

namespace minipy {

StmtPtr Parser::parse_function_statement(int indent, const std::string& line) {
  const auto line_no = lines[index].line_no;
  const std::string line_text = line;
  const auto colon = find_header_colon(line_text);
  auto header = trim_static(line_text.substr(3, colon - 3));

  auto open = header.find('(');
  auto close = header.find(')');
  if (open == std::string::npos || close == std::string::npos || close < open ||
      close != header.size() - 1) {
    throw parse_error(line_no, "invalid function signature", line_text);
  }

  std::string name = trim_static(header.substr(0, open));
  if (!is_identifier_token(name)) {
    throw parse_error(line_no, "invalid function name", line_text);
  }

  std::vector<std::string> params;
  const std::string params_src = trim_static(header.substr(open + 1, close - open - 1));
  if (!params_src.empty()) {
    std::size_t pos = 0;
    while (true) {
      auto next = params_src.find(',', pos);
      std::string param = trim_static(params_src.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
      if (!is_identifier_token(param)) {
        throw parse_error(line_no, "invalid function parameter", line_text);
      }
      if (std::find(params.begin(), params.end(), param) != params.end()) {
        throw parse_error(line_no, "duplicate function parameter: " + param, line_text);
      }
      params.push_back(param);
      if (next == std::string::npos) {
        break;
      }
      pos = next + 1;
    }
  }

  auto body = parse_suite(indent, colon, "function");
  return std::make_unique<FunctionDefStmt>(std::move(name), std::move(params), std::move(body));
}

}  // namespace minipy
