#include <cassert>
#include <string>

#include "minipy/ast.h"
#include "minipy/parser.h"

namespace {

void assert_ast_snapshot(const std::string& source, const std::string& expected_source) {
  minipy::Parser parser(source);
  auto program = parser.parse_program();
  const auto actual = minipy::to_source(*program);
  assert(actual == expected_source);
}

// Printing and re-parsing must be a fixed point.
void assert_round_trip_stable(const std::string& source) {
  minipy::Parser first(source);
  const auto printed = minipy::to_source(*first.parse_program());
  minipy::Parser second(printed);
  assert(minipy::to_source(*second.parse_program()) == printed);
}

bool parse_fails(const std::string& source) {
  try {
    minipy::Parser parser(source);
    parser.parse_program();
  } catch (const minipy::ParseException&) {
    return true;
  }
  return false;
}

std::string parse_error_message(const std::string& source) {
  try {
    minipy::Parser parser(source);
    parser.parse_program();
  } catch (const minipy::ParseException& err) {
    return err.what();
  }
  return "";
}

void test_parser_assignment_and_expression() {
  assert_ast_snapshot(R"(
a = 1 + 2 * 3
a
)", "a = 1 + 2 * 3\na\n");
}

void test_parser_grouping_is_minimal() {
  assert_ast_snapshot(R"(
b = (1 + 2) * 3
c = 1 - (2 - 3)
d = (1 - 2) - 3
e = ((x))
)", "b = (1 + 2) * 3\nc = 1 - (2 - 3)\nd = 1 - 2 - 3\ne = x\n");
}

void test_parser_if_elif_else_blocks() {
  assert_ast_snapshot(R"(
if False:
  x = 1
elif True:
  x = 2
else:
  x = 3
)", "if False:\n    x = 1\nelif True:\n    x = 2\nelse:\n    x = 3\n");
}

void test_parser_for_def_and_return() {
  assert_ast_snapshot(R"(
def f(x, y):
  return x + y
for v in range(3):
  print(v)
)", "def f(x, y):\n    return x + y\nfor v in range(3):\n    print(v)\n");
}

void test_parser_nested_blocks_dedent() {
  assert_ast_snapshot(R"(
def g(n):
    total = 0
    for i in range(n):
        if i % 2 == 0:
            total = total + i
    return total
print(g(5))
)", "def g(n):\n    total = 0\n    for i in range(n):\n        if i % 2 == 0:\n            total = total + i\n"
    "    return total\nprint(g(5))\n");
}

void test_parser_inline_suites() {
  assert_ast_snapshot(R"(
def one(): return 1
if x: y = 1
else: y = 2
for i in xs: print(i)
)", "def one():\n    return 1\nif x:\n    y = 1\nelse:\n    y = 2\nfor i in xs:\n    print(i)\n");
}

void test_parser_pipe_chains() {
  assert_ast_snapshot(R"(
x = [1, 2] | add | double
y = f(a | g)
z = (a + 1) | g
)", "x = [1, 2] | add | double\ny = f(a | g)\nz = a + 1 | g\n");
}

void test_parser_boolean_operators() {
  assert_ast_snapshot(R"(
x = not a and b or c
y = not (a == b)
z = a == (not b)
w = a or (b or c)
)", "x = not a and b or c\ny = not a == b\nz = a == (not b)\nw = a or (b or c)\n");
}

void test_parser_unary_minus_and_indexing() {
  assert_ast_snapshot(R"(
x = -y * 2
w = -(1 + 2)
xs[0] = xs[1 + 1]
m[0][1] = -5
)", "x = -y * 2\nw = -(1 + 2)\nxs[0] = xs[1 + 1]\nm[0][1] = -5\n");
}

void test_parser_comparisons_do_not_chain() {
  assert_ast_snapshot(R"(
x = (a < b) < c
y = a < (b < c)
z = a == b and b != c
)", "x = (a < b) < c\ny = a < (b < c)\nz = a == b and b != c\n");
  assert_round_trip_stable("t = (1 < 2) == (3 >= 4)\n");

  assert(parse_fails("x = 3 > 2 > 1\n"));
  assert(parse_fails("x = a == b == c\n"));
  assert(parse_fails("x = a < b + 1 <= c\n"));
  assert(parse_fails("x = not a < b <= c\n"));
  assert(parse_fails("print(1 < 2 < 3)\n"));
}

void test_parser_int64_min_literal() {
  assert_ast_snapshot("m = -9223372036854775808\n", "m = (-9223372036854775808)\n");
  assert_round_trip_stable("m = -9223372036854775808 + 1\n");
  assert_ast_snapshot("n = -9223372036854775807\n", "n = -9223372036854775807\n");

  assert(parse_fails("x = 9223372036854775808\n"));
  assert(parse_fails("x = -9223372036854775809\n"));
  assert(parse_fails("x = -9223372036854775808[0]\n"));
}

void test_parser_literals_and_comments() {
  assert_ast_snapshot(R"(
# leading comment
s = 'hi'   # trailing comment
t = "a#b"
u = [None, True, False, []]

v = "line\n"
)", "s = \"hi\"\nt = \"a#b\"\nu = [None, True, False, []]\nv = \"line\\n\"\n");
}

void test_parser_print_statement() {
  minipy::Parser parser("print(1 + 2)\n");
  auto program = parser.parse_program();
  assert(program->body.size() == 1);
  assert(program->body.front()->kind == minipy::Stmt::Kind::Print);
}

void test_parser_round_trip_is_stable() {
  assert_round_trip_stable(R"(
def fib(n):
  if n < 2:
    return n
  return fib(n - 1) + fib(n - 2)
xs = range(10) | len
for i in range(xs):
  if not i == 3 and i > 1 or False: print(fib(i))
  elif i == 0:
    print(-i)
)");
}

void test_parser_rejects_malformed_programs() {
  assert(parse_fails("x = (1 + 2\n"));
  assert(parse_fails("x = 1 +\n"));
  assert(parse_fails("  x = 1\n"));
  assert(parse_fails("if x:\nprint(1)\n"));
  assert(parse_fails("else:\n    x = 1\n"));
  assert(parse_fails("return\n"));
  assert(parse_fails("1 = x\n"));
  assert(parse_fails("f(1) = 2\n"));
  assert(parse_fails("x = a | 3\n"));
  assert(parse_fails("x = 1 == not y\n"));
  assert(parse_fails("print(1, 2)\n"));
  assert(parse_fails("def = 3\n"));
  assert(parse_fails("x = 99999999999999999999\n"));
  assert(parse_fails("for i range(3):\n    print(i)\n"));
  assert(parse_fails("def f(x, x):\n    return x\n"));
  assert(parse_fails("def f():\n    def g():\n        return 1\n    return 2\n"));
  assert(parse_fails("if True: if x: y = 1\n"));
  assert(parse_fails("x = 'open\n"));
  assert(parse_fails("x = y.z\n"));
  assert(parse_fails("x = [1, 2](0)\n"));
}

void test_parser_errors_carry_line_numbers() {
  const auto message = parse_error_message("x = 1\n\ny = (2 +\n");
  assert(message.rfind("line 3: ", 0) == 0);
}

}  // namespace

int main() {
  test_parser_assignment_and_expression();
  test_parser_grouping_is_minimal();
  test_parser_if_elif_else_blocks();
  test_parser_for_def_and_return();
  test_parser_nested_blocks_dedent();
  test_parser_inline_suites();
  test_parser_pipe_chains();
  test_parser_boolean_operators();
  test_parser_unary_minus_and_indexing();
  test_parser_comparisons_do_not_chain();
  test_parser_int64_min_literal();
  test_parser_literals_and_comments();
  test_parser_print_statement();
  test_parser_round_trip_is_stable();
  test_parser_rejects_malformed_programs();
  test_parser_errors_carry_line_numbers();
  return 0;
}
