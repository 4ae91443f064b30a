#pragma once

#include <string>
#include <vector>

#include "minipy/parser.h"

namespace minipy {

class Lexer {
 public:
  Lexer(std::string text, int line_no = 0);

  std::vector<ExprToken> tokenize() const;

 private:
  std::string source;
  int line_no;
};

}  // namespace minipy
