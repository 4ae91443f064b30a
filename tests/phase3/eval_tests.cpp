#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "minipy/evaluator.h"
#include "minipy/parser.h"

namespace {

minipy::InterpreterOptions default_options() {
  return minipy::InterpreterOptions{};
}

void run_program(const std::string& source, const std::string& expected_name, const minipy::Value& expected,
                 const minipy::InterpreterOptions& options = default_options()) {
  std::ostringstream out;
  minipy::Interpreter interpreter(out, options);
  minipy::Parser parser(source);
  auto program = parser.parse_program();
  interpreter.run(*program);
  assert(interpreter.has_global(expected_name));
  const auto actual = interpreter.global(expected_name);
  if (!actual.equals(expected)) {
    std::cerr << "Mismatch for variable '" << expected_name << "'\n";
    std::cerr << "Source:\n" << source << "\n";
    std::cerr << "Expected: " << expected.to_string() << "\n";
    std::cerr << "Actual:   " << actual.to_string() << "\n";
    assert(false);
  }
}

std::string run_output(const std::string& source, const minipy::InterpreterOptions& options = default_options()) {
  std::ostringstream out;
  minipy::Interpreter interpreter(out, options);
  interpreter.run_source(source);
  return out.str();
}

void expect_error(const std::string& source, minipy::ErrorKind expected,
                  const minipy::InterpreterOptions& options = default_options()) {
  std::ostringstream out;
  minipy::Interpreter interpreter(out, options);
  try {
    interpreter.run_source(source);
  } catch (const minipy::EvalException& err) {
    if (err.kind != expected) {
      std::cerr << "Unexpected error kind for source:\n" << source << "\n";
      std::cerr << "Expected: " << minipy::error_kind_name(expected) << "\n";
      std::cerr << "Actual:   " << err.what() << "\n";
      assert(false);
    }
    return;
  }
  std::cerr << "Expected " << minipy::error_kind_name(expected) << " for source:\n" << source << "\n";
  assert(false);
}

minipy::Value int_list(const std::vector<long long>& values) {
  std::vector<minipy::Value> out;
  for (const auto v : values) {
    out.push_back(minipy::Value::int_value_of(v));
  }
  return minipy::Value::list_value_of(std::move(out));
}

void run_scalar_programs() {
  run_program(R"(
x = 1
y = 2
z = x * y + 3
)", "z", minipy::Value::int_value_of(5));

  run_program(R"(
s = "ab" + "cd"
)", "s", minipy::Value::string_value_of("abcd"));

  run_program(R"(
xs = [1, 2] + [3]
)", "xs", int_list({1, 2, 3}));

  run_program(R"(
a = 7 / 2
b = -7 / 2
c = -7 % 2
d = 7 % -2
e = a + b + c + d
)", "e", minipy::Value::int_value_of(3 + -3 + -1 + 1));
}

void run_bulk_arithmetic_suite() {
  for (int i = 0; i < 50; ++i) {
    std::ostringstream stream;
    stream << "x = " << i << "\n"
           << "y = x * 3 - " << (i % 7) << "\n"
           << "z = y % 5 + y / 4\n";
    const long long y = static_cast<long long>(i) * 3 - (i % 7);
    run_program(stream.str(), "z", minipy::Value::int_value_of(y % 5 + y / 4));
  }
}

void run_integer_wrapping_programs() {
  run_program(R"(
m = -9223372036854775807 - 1
q = m / -1
)", "q", minipy::Value::int_value_of(-9223372036854775807LL - 1));

  run_program(R"(
m = -9223372036854775807 - 1
r = m % -1
)", "r", minipy::Value::int_value_of(0));

  run_program(R"(
m = -9223372036854775807 - 1
w = m - 1
)", "w", minipy::Value::int_value_of(9223372036854775807LL));

  run_program(R"(
m = -9223372036854775807 - 1
n = -m
)", "n", minipy::Value::int_value_of(-9223372036854775807LL - 1));

  run_program(R"(
m = -9223372036854775808
same = m == -9223372036854775807 - 1
)", "same", minipy::Value::bool_value_of(true));
  run_program("p = 2 * -9223372036854775808\n", "p", minipy::Value::int_value_of(0));

  expect_error("x = 1 / 0\n", minipy::ErrorKind::DivisionError);
  expect_error("x = 1 % 0\n", minipy::ErrorKind::DivisionError);
}

void run_comparison_programs() {
  const auto yes = minipy::Value::bool_value_of(true);
  run_program("t = None < True\n", "t", yes);
  run_program("t = True < 0\n", "t", yes);
  run_program("t = 1 < \"a\"\n", "t", yes);
  run_program("t = \"z\" < []\n", "t", yes);
  run_program("t = [1, 2, 3] > [9]\n", "t", yes);
  run_program("t = [1, 2] < [1, 3]\n", "t", yes);
  run_program("t = \"abc\" <= \"abd\"\n", "t", yes);
  run_program("t = [1, [2]] == [1, [2]]\n", "t", yes);
  run_program("t = None == None\n", "t", yes);
  run_program("t = 1 != \"1\"\n", "t", yes);
  run_program("t = (1 == True) == False\n", "t", yes);
}

void run_boolean_operator_programs() {
  // The right operand would raise if it were evaluated.
  run_program("x = False and missing()\n", "x", minipy::Value::bool_value_of(false));
  run_program("x = True or missing()\n", "x", minipy::Value::bool_value_of(true));
  run_program("x = not (1 > 2) and True\n", "x", minipy::Value::bool_value_of(true));

  expect_error("x = 1 and True\n", minipy::ErrorKind::TypeError);
  expect_error("x = True and 1\n", minipy::ErrorKind::TypeError);
  expect_error("x = False or []\n", minipy::ErrorKind::TypeError);
  expect_error("x = not 1\n", minipy::ErrorKind::TypeError);
  expect_error("x = -\"a\"\n", minipy::ErrorKind::TypeError);
  expect_error("x = [1] + 1\n", minipy::ErrorKind::TypeError);
  expect_error("x = \"a\" * 2\n", minipy::ErrorKind::TypeError);
  expect_error("x = [1] - [1]\n", minipy::ErrorKind::TypeError);
}

void run_eager_or_programs() {
  const std::string source = R"(
def side():
    print("side")
    return True
x = True or side()
y = False and side()
)";
  assert(run_output(source).empty());

  auto eager = default_options();
  eager.short_circuit_or = false;
  assert(run_output(source, eager) == "side\n");
  run_program(source, "x", minipy::Value::bool_value_of(true), eager);
  expect_error("x = True or 1\n", minipy::ErrorKind::TypeError, eager);
}

void run_function_programs() {
  run_program(R"(
def fib(n):
    if n < 2:
        return n
    return fib(n - 1) + fib(n - 2)
r = fib(15)
)", "r", minipy::Value::int_value_of(610));

  // Calls may precede the definition in the file.
  run_program(R"(
r = later(4)
def later(x):
    return x * x
)", "r", minipy::Value::int_value_of(16));

  run_program(R"(
def g():
    return 1
def g():
    return 2
r = g()
)", "r", minipy::Value::int_value_of(2));

  run_program(R"(
def h():
    x = 1
r = h()
)", "r", minipy::Value::none());

  run_program(R"(
def first_even(xs):
    for x in xs:
        if x % 2 == 0:
            return x
    return -1
r = first_even([3, 5, 8, 10])
)", "r", minipy::Value::int_value_of(8));

  run_program(R"(
def square(x):
    return x * x
def add(a, b):
    return a + b
r = [3, 4] | add | square
)", "r", minipy::Value::int_value_of(49));

  run_program(R"(
xs = [1, 2, 3]
n = xs | len
)", "n", minipy::Value::int_value_of(3));
}

void run_call_scope_programs() {
  const std::string source = R"(
g = 10
def read_global():
    return g
r = read_global()
)";
  expect_error(source, minipy::ErrorKind::NameError);

  auto caller = default_options();
  caller.call_scope = minipy::CallScope::CallerCopy;
  run_program(source, "r", minipy::Value::int_value_of(10), caller);

  // Assignments inside the copy never reach the caller.
  run_program(R"(
g = 10
def write_global():
    g = 99
    return g
r = write_global()
)", "g", minipy::Value::int_value_of(10), caller);

  // The callee's locals are discarded after the call.
  run_program(R"(
def f(a):
    tmp = a + 1
    return tmp
r = f(1)
)", "r", minipy::Value::int_value_of(2));
  expect_error(R"(
def f(a):
    tmp = a + 1
    return tmp
r = f(1)
print(tmp)
)", minipy::ErrorKind::NameError);
}

void run_list_programs() {
  run_program(R"(
def set0(xs):
    xs[0] = 9
ys = [1, 2]
set0(ys)
)", "ys", int_list({9, 2}));

  run_program(R"(
xs = [1, 2, 3]
total = 0
for x in xs:
    xs[2] = 100
    total = total + x
)", "total", minipy::Value::int_value_of(6));

  run_program(R"(
xs = [1, 2, 3]
for x in xs:
    xs[2] = 100
)", "xs", int_list({1, 2, 100}));

  run_program(R"(
total = 0
for i in range(5):
    total = total + i
last = i
)", "last", minipy::Value::int_value_of(4));

  run_program(R"(
m = [[1, 2], [3, 4]]
m[1][0] = m[0][1] + 5
v = m[1][0]
)", "v", minipy::Value::int_value_of(7));

  run_program("e = range(0)\n", "e", minipy::Value::list_value_of({}));
  run_program("n = len([])\n", "n", minipy::Value::int_value_of(0));

  expect_error("xs = [1]\nx = xs[1]\n", minipy::ErrorKind::IndexError);
  expect_error("xs = [1]\nx = xs[-1]\n", minipy::ErrorKind::IndexError);
  expect_error("xs = [1]\nxs[1] = 2\n", minipy::ErrorKind::IndexError);
  expect_error("xs = [1]\nx = xs[\"a\"]\n", minipy::ErrorKind::TypeError);
  expect_error("x = 5[0]\n", minipy::ErrorKind::TypeError);
  expect_error("x = 5\nx[0] = 1\n", minipy::ErrorKind::TypeError);
  expect_error("for x in 5:\n    print(x)\n", minipy::ErrorKind::TypeError);
}

void run_error_programs() {
  expect_error("print(y)\n", minipy::ErrorKind::NameError);
  expect_error("x = nope(1)\n", minipy::ErrorKind::NameError);
  expect_error("x = [1] | nope\n", minipy::ErrorKind::NameError);
  expect_error("def len(x):\n    return 0\n", minipy::ErrorKind::NameError);
  expect_error("def range(x):\n    return 0\n", minipy::ErrorKind::NameError);
  expect_error("x = print(1)\n", minipy::ErrorKind::NameError);
  expect_error("return 1\n", minipy::ErrorKind::ReturnError);
  expect_error("if True:\n    return 1\n", minipy::ErrorKind::ReturnError);
  expect_error("x = len(1, 2)\n", minipy::ErrorKind::ArityError);
  expect_error("x = len()\n", minipy::ErrorKind::ArityError);
  expect_error("x = [1, 2, 3] | len\n", minipy::ErrorKind::ArityError);
  expect_error("x = len(5)\n", minipy::ErrorKind::TypeError);
  expect_error("x = range(\"a\")\n", minipy::ErrorKind::TypeError);
  expect_error("x = range(-1)\n", minipy::ErrorKind::ValueError);

  // Arity is checked before any argument is evaluated.
  expect_error("def f(a, b):\n    return a\nx = f(missing)\n", minipy::ErrorKind::ArityError);
  expect_error("x = len(missing, 1)\n", minipy::ErrorKind::ArityError);
}

void run_recursion_limit_programs() {
  auto shallow = default_options();
  shallow.max_call_depth = 50;
  expect_error(R"(
def down(n):
    return down(n + 1)
x = down(0)
)", minipy::ErrorKind::RecursionError, shallow);

  run_program(R"(
def count(n):
    if n == 0:
        return 0
    return 1 + count(n - 1)
x = count(49)
)", "x", minipy::Value::int_value_of(49), shallow);

  // The depth counter unwinds after an error is raised inside a call.
  std::ostringstream out;
  minipy::Interpreter interpreter(out, shallow);
  try {
    interpreter.run_source("def bad(n):\n    return bad(n + 1)\nx = bad(0)\n");
    assert(false);
  } catch (const minipy::EvalException& err) {
    assert(err.kind == minipy::ErrorKind::RecursionError);
  }
  interpreter.run_source("def ok(n):\n    if n == 0:\n        return 7\n    return ok(n - 1)\ny = ok(40)\n");
  assert(interpreter.global("y").equals(minipy::Value::int_value_of(7)));
}

void run_session_programs() {
  std::ostringstream out;
  minipy::Interpreter interpreter(out, default_options());
  interpreter.run_source("x = 1\ndef inc(v):\n    return v + 1\n");
  interpreter.run_source("y = inc(x)\n");
  assert(interpreter.global("y").equals(minipy::Value::int_value_of(2)));
  assert(interpreter.functions().contains("inc"));
  assert(interpreter.functions().is_sealed());

  interpreter.reset();
  assert(!interpreter.has_global("x"));
  assert(interpreter.functions().size() == 0);
}

}  // namespace

int main() {
  run_scalar_programs();
  run_bulk_arithmetic_suite();
  run_integer_wrapping_programs();
  run_comparison_programs();
  run_boolean_operator_programs();
  run_eager_or_programs();
  run_function_programs();
  run_call_scope_programs();
  run_list_programs();
  run_error_programs();
  run_recursion_limit_programs();
  run_session_programs();
  return 0;
}
