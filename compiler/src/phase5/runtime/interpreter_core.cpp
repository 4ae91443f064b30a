#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace minipy {

Interpreter::Interpreter(std::ostream& out_stream, InterpreterOptions options)
    : out(&out_stream), opts(options) {
  reset();
}

void Interpreter::reset() {
  globals = std::make_shared<Environment>();
  function_table.clear();
  owned_programs.clear();
  call_depth = 0;
}

void Interpreter::print_value(const Value& value) {
  *out << value.to_string() << '\n';
  out->flush();
}

// Every def is registered before the first statement runs, so a call may
// precede its definition in the file. Globals persist across run() calls
// until reset().
Value Interpreter::run(const Program& program) {
  function_table.unseal();
  for (const auto& stmt : program.body) {
    if (stmt->kind == Stmt::Kind::FunctionDef) {
      function_table.define(static_cast<const FunctionDefStmt&>(*stmt));
    }
  }
  function_table.seal();

  call_depth = 0;
  try {
    for (const auto& stmt : program.body) {
      if (stmt->kind == Stmt::Kind::FunctionDef) {
        continue;
      }
      execute(*stmt, globals);
    }
  } catch (const ReturnSignal&) {
    throw EvalException(ErrorKind::ReturnError, "return outside function");
  }
  return Value::none();
}

// The parsed program is kept alive because the function table points into it.
Value Interpreter::run_source(const std::string& source) {
  Parser parser(source);
  owned_programs.push_back(parser.parse_program());
  return run(*owned_programs.back());
}

bool Interpreter::has_global(std::string name) const {
  return globals && globals->contains(name);
}

Value Interpreter::global(std::string name) const {
  if (!globals) {
    throw EvalException(ErrorKind::NameError, "interpreter has no global environment");
  }
  return globals->get(name);
}

std::unordered_map<std::string, Value> Interpreter::snapshot_globals() const {
  std::unordered_map<std::string, Value> out_values;
  if (!globals) {
    return out_values;
  }
  for (const auto& name : globals->keys()) {
    out_values.emplace(name, globals->get(name));
  }
  return out_values;
}

}  // namespace minipy
