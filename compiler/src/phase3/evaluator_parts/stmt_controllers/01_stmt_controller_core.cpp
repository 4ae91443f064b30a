#include "../internal_helpers.h"

namespace minipy {
namespace {

void exec_stmt_expression_controller(const Stmt* stmt, Interpreter& self,
                                     const std::shared_ptr<Environment>& env) {
  execute_case_expression(*static_cast<const ExpressionStmt*>(stmt), self, env);
}

void exec_stmt_print_controller(const Stmt* stmt, Interpreter& self,
                                const std::shared_ptr<Environment>& env) {
  execute_case_print(*static_cast<const PrintStmt*>(stmt), self, env);
}

void exec_stmt_assign_controller(const Stmt* stmt, Interpreter& self,
                                 const std::shared_ptr<Environment>& env) {
  execute_case_assign(*static_cast<const AssignStmt*>(stmt), self, env);
}

void exec_stmt_return_controller(const Stmt* stmt, Interpreter& self,
                                 const std::shared_ptr<Environment>& env) {
  execute_case_return(*static_cast<const ReturnStmt*>(stmt), self, env);
}

}  // namespace

FastStmtExecFn stmt_exec_controller_core_for_kind(Stmt::Kind kind) {
  switch (kind) {
    case Stmt::Kind::Expression:
      return &exec_stmt_expression_controller;
    case Stmt::Kind::Print:
      return &exec_stmt_print_controller;
    case Stmt::Kind::Assign:
      return &exec_stmt_assign_controller;
    case Stmt::Kind::Return:
      return &exec_stmt_return_controller;
    default:
      return nullptr;
  }
}

}  // namespace minipy
