#pragma once

#include <cstddef>
#include <iostream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "minipy/ast.h"

namespace minipy {

struct Value {
  // Declaration order is the cross-tag ordering rank.
  enum class Kind {
    None,
    Bool,
    Int,
    String,
    List,
  };

  using ListStorage = std::vector<Value>;

  Kind kind = Kind::None;
  long long int_value = 0;
  bool bool_value = false;
  std::string string_value;
  // Shared by every holder; the vector is never resized after construction.
  std::shared_ptr<ListStorage> list_value;

  static Value none();
  static Value int_value_of(long long v);
  static Value bool_value_of(bool v);
  static Value string_value_of(std::string v);
  static Value list_value_of(std::vector<Value> values);

  std::size_t list_size() const;

  std::string to_string() const;
  bool equals(const Value& other) const;
  // <0, 0 or >0, total across all tags.
  int compare(const Value& other) const;
};

const char* value_kind_name(Value::Kind kind);

// One activation's bindings. Assignment replaces; there is no parent chain.
struct Environment {
  Environment() = default;

  void define(std::string name, const Value& value);
  void define(std::string name, Value&& value);
  bool contains(const std::string& name) const;
  Value get(const std::string& name) const;
  Value* get_ptr(const std::string& name);
  const Value* get_ptr(const std::string& name) const;
  std::vector<std::string> keys() const;
  std::size_t size() const { return values.size(); }

  // Shallow copy: list storage stays shared with the source.
  std::shared_ptr<Environment> clone() const;

  std::unordered_map<std::string, Value> values;
};

struct FunctionEntry {
  std::string name;
  std::vector<std::string> params;
  const StmtList* body = nullptr;  // not owned; the Program owns function bodies
};

class FunctionTable {
 public:
  void define(const FunctionDefStmt& def);
  const FunctionEntry* find(const std::string& name) const;
  bool contains(const std::string& name) const;
  std::vector<std::string> names() const;
  std::size_t size() const { return entries.size(); }

  void seal() { sealed = true; }
  void unseal() { sealed = false; }
  bool is_sealed() const { return sealed; }
  void clear();

  static bool is_builtin_name(const std::string& name);

 private:
  std::unordered_map<std::string, FunctionEntry> entries;
  bool sealed = false;
};

enum class ErrorKind {
  NameError,
  TypeError,
  ArityError,
  IndexError,
  DivisionError,
  ValueError,
  ReturnError,
  RecursionError,
};

const char* error_kind_name(ErrorKind kind);

struct EvalException : public std::runtime_error {
  EvalException(ErrorKind error_kind, const std::string& msg)
      : std::runtime_error(std::string(error_kind_name(error_kind)) + ": " + msg),
        kind(error_kind),
        detail(msg) {}

  ErrorKind kind;
  std::string detail;
};

enum class CallScope {
  ParametersOnly,
  CallerCopy,
};

struct InterpreterOptions {
  CallScope call_scope = CallScope::ParametersOnly;
  bool short_circuit_or = true;
  bool trace_calls = false;
  std::size_t max_call_depth = 1000;

  // MINIPY_CALL_SCOPE, MINIPY_OR_SHORT_CIRCUIT, MINIPY_TRACE_CALLS, MINIPY_MAX_CALL_DEPTH.
  static InterpreterOptions from_env();
};

class Interpreter {
 public:
  explicit Interpreter(std::ostream& out = std::cout,
                       InterpreterOptions options = InterpreterOptions::from_env());

  Value run(const Program& program);
  Value run_source(const std::string& source);
  void reset();

  bool has_global(std::string name) const;
  Value global(std::string name) const;
  std::unordered_map<std::string, Value> snapshot_globals() const;
  const FunctionTable& functions() const { return function_table; }
  const InterpreterOptions& options() const { return opts; }

  Value evaluate(const Expr& expr, const std::shared_ptr<Environment>& env);
  void execute(const Stmt& stmt, const std::shared_ptr<Environment>& env);
  void execute_block(const StmtList& body, const std::shared_ptr<Environment>& env);

  Value call_function(const std::string& name, const std::vector<const Expr*>& args,
                      const std::shared_ptr<Environment>& env);
  void print_value(const Value& value);

  static bool truthy(const Value& value);

  Value eval_binary(BinaryOp op, const Value& left, const Value& right) const;
  Value eval_unary(UnaryOp op, const Value& operand) const;

  struct ReturnSignal {
    Value value;
  };

 private:
  std::ostream* out;
  InterpreterOptions opts;
  FunctionTable function_table;
  std::shared_ptr<Environment> globals;
  std::vector<std::unique_ptr<Program>> owned_programs;
  std::size_t call_depth = 0;
};

}  // namespace minipy
