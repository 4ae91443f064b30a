#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "minipy/evaluator.h"
#include "minipy/parser.h"

namespace minipy {

// Canonical env-flag parser for the MINIPY_* boolean toggles.
inline bool parse_env_flag_value(const char* raw, bool fallback) {
  if (!raw || *raw == '\0') {
    return fallback;
  }
  const std::string value(raw);
  if (value == "0" || value == "false" || value == "False" || value == "off" ||
      value == "OFF" || value == "no" || value == "NO") {
    return false;
  }
  return true;
}

inline bool env_flag_enabled(const char* name, bool fallback) {
  return parse_env_flag_value(std::getenv(name), fallback);
}

// Builtins resolved before the function table. Arguments are already evaluated.
bool is_builtin_function(const std::string& name);
Value call_builtin_function(const std::string& name, const std::vector<Value>& args);

// Checked element access shared by index reads and element stores.
Value::ListStorage& expect_list_storage(const Value& target, const char* context);
std::size_t checked_list_index(const Value& index, std::size_t size);
// True when `value` is, or transitively contains, the list storage `target`.
bool list_storage_reaches(const Value& value, const Value::ListStorage* target);

// Expression handlers.
Value evaluate_case_int(const IntExpr& expr, Interpreter& self,
                        const std::shared_ptr<Environment>& env);
Value evaluate_case_string(const StringExpr& expr, Interpreter& self,
                           const std::shared_ptr<Environment>& env);
Value evaluate_case_bool(const BoolExpr& expr, Interpreter& self,
                         const std::shared_ptr<Environment>& env);
Value evaluate_case_none(const NoneExpr& expr, Interpreter& self,
                         const std::shared_ptr<Environment>& env);
Value evaluate_case_variable(const VariableExpr& expr, Interpreter& self,
                             const std::shared_ptr<Environment>& env);
Value evaluate_case_list(const ListExpr& list, Interpreter& self,
                         const std::shared_ptr<Environment>& env);
Value evaluate_case_unary(const UnaryExpr& unary, Interpreter& self,
                          const std::shared_ptr<Environment>& env);
Value evaluate_case_binary(const BinaryExpr& binary, Interpreter& self,
                           const std::shared_ptr<Environment>& env);
Value evaluate_case_call(const CallExpr& call, Interpreter& self,
                         const std::shared_ptr<Environment>& env);
Value evaluate_case_index(const IndexExpr& index_expr, Interpreter& self,
                          const std::shared_ptr<Environment>& env);
Value evaluate_case_pipe(const PipeExpr& pipe, Interpreter& self,
                         const std::shared_ptr<Environment>& env);

using FastExprEvalFn = Value (*)(const Expr*, Interpreter&, const std::shared_ptr<Environment>&);

FastExprEvalFn expr_eval_controller_for_kind(Expr::Kind kind);

inline Value execute_expr_fast(const Expr& expr, Interpreter& self,
                               const std::shared_ptr<Environment>& env) {
  const auto fn = expr_eval_controller_for_kind(expr.kind);
  if (!fn) {
    throw EvalException(ErrorKind::TypeError, "unsupported expression");
  }
  return fn(&expr, self, env);
}

// Statement handlers.
void execute_case_expression(const ExpressionStmt& stmt, Interpreter& self,
                             const std::shared_ptr<Environment>& env);
void execute_case_print(const PrintStmt& stmt, Interpreter& self,
                        const std::shared_ptr<Environment>& env);
void execute_case_assign(const AssignStmt& assign, Interpreter& self,
                         const std::shared_ptr<Environment>& env);
void execute_case_return(const ReturnStmt& stmt, Interpreter& self,
                         const std::shared_ptr<Environment>& env);
void execute_case_if(const IfStmt& stmt, Interpreter& self,
                     const std::shared_ptr<Environment>& env);
void execute_case_for(const ForStmt& stmt, Interpreter& self,
                      const std::shared_ptr<Environment>& env);

using FastStmtExecFn = void (*)(const Stmt*, Interpreter&, const std::shared_ptr<Environment>&);

// Controller/orchestrator contract:
// - leaf controller modules expose statement-kind mappings for their domain
//   (core, control-flow)
// - one orchestrator resolves final handler selection.
FastStmtExecFn stmt_exec_controller_for_kind(Stmt::Kind kind);

inline void execute_stmt_fast(const Stmt& stmt, Interpreter& self,
                              const std::shared_ptr<Environment>& env) {
  const auto fn = stmt_exec_controller_for_kind(stmt.kind);
  if (!fn) {
    throw EvalException(ErrorKind::TypeError, "unsupported statement");
  }
  fn(&stmt, self, env);
}

}  // namespace minipy
