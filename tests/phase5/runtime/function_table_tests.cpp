#include <cassert>
#include <memory>
#include <sstream>
#include <string>

#include "phase5_support.h"

namespace {

void test_definitions_are_collected_before_execution() {
  minipy::Parser parser(R"(
def b(x):
    return x
def a():
    return 1
)");
  auto program = parser.parse_program();

  minipy::FunctionTable table;
  for (const auto& stmt : program->body) {
    table.define(static_cast<const minipy::FunctionDefStmt&>(*stmt));
  }
  assert(table.size() == 2);
  const auto names = table.names();
  assert(names.size() == 2);
  assert(names[0] == "a");
  assert(names[1] == "b");

  const auto* entry = table.find("b");
  assert(entry != nullptr);
  assert(entry->params.size() == 1);
  assert(entry->params[0] == "x");
  assert(entry->body != nullptr);
  assert(entry->body->size() == 1);
  assert(table.find("c") == nullptr);
}

void test_sealed_table_rejects_definitions() {
  minipy::Parser parser("def f():\n    return 1\n");
  auto program = parser.parse_program();
  const auto& def = static_cast<const minipy::FunctionDefStmt&>(*program->body.front());

  minipy::FunctionTable table;
  table.seal();
  assert(table.is_sealed());
  bool threw = false;
  try {
    table.define(def);
  } catch (const minipy::EvalException& err) {
    threw = err.kind == minipy::ErrorKind::NameError;
  }
  assert(threw);

  table.unseal();
  table.define(def);
  assert(table.contains("f"));

  table.clear();
  assert(table.size() == 0);
  assert(!table.is_sealed());
}

void test_definitions_are_not_executable_statements() {
  minipy::Parser parser("def f():\n    return 1\n");
  auto program = parser.parse_program();
  std::ostringstream out;
  minipy::Interpreter interpreter(out, minipy::InterpreterOptions{});
  bool threw = false;
  try {
    interpreter.execute(*program->body.front(), std::make_shared<minipy::Environment>());
  } catch (const minipy::EvalException& err) {
    threw = err.kind == minipy::ErrorKind::TypeError;
  }
  assert(threw);
  assert(!interpreter.functions().contains("f"));

  interpreter.run(*program);
  assert(interpreter.functions().contains("f"));
}

void test_builtin_names_are_reserved() {
  assert(minipy::FunctionTable::is_builtin_name("len"));
  assert(minipy::FunctionTable::is_builtin_name("range"));
  assert(!minipy::FunctionTable::is_builtin_name("print"));
  phase5_test::expect_error_kind("def len(xs):\n    return 0\n", minipy::ErrorKind::NameError);
}

void test_function_namespace_is_separate_from_variables() {
  phase5_test::expect_global_int(R"(
def f(x):
    return x + 1
f = 10
r = f(f)
)", "r", 11);
}

void test_arity_errors() {
  phase5_test::expect_error_kind("def f(a, b):\n    return a\nx = f(1)\n", minipy::ErrorKind::ArityError);
  phase5_test::expect_error_kind("def f():\n    return 1\nx = f(1)\n", minipy::ErrorKind::ArityError);
  phase5_test::expect_error_kind("def f(a):\n    return a\nx = [1, 2] | f\n", minipy::ErrorKind::ArityError);
}

}  // namespace

namespace phase5_test {

void run_function_table_tests() {
  test_definitions_are_collected_before_execution();
  test_sealed_table_rejects_definitions();
  test_definitions_are_not_executable_statements();
  test_builtin_names_are_reserved();
  test_function_namespace_is_separate_from_variables();
  test_arity_errors();
}

}  // namespace phase5_test
