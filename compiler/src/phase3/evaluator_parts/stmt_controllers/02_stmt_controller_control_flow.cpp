#include "../internal_helpers.h"

namespace minipy {
namespace {

void exec_stmt_if_controller(const Stmt* stmt, Interpreter& self,
                             const std::shared_ptr<Environment>& env) {
  execute_case_if(*static_cast<const IfStmt*>(stmt), self, env);
}

void exec_stmt_for_controller(const Stmt* stmt, Interpreter& self,
                              const std::shared_ptr<Environment>& env) {
  execute_case_for(*static_cast<const ForStmt*>(stmt), self, env);
}

}  // namespace

FastStmtExecFn stmt_exec_controller_control_flow_for_kind(Stmt::Kind kind) {
  switch (kind) {
    case Stmt::Kind::If:
      return &exec_stmt_if_controller;
    case Stmt::Kind::For:
      return &exec_stmt_for_controller;
    default:
      return nullptr;
  }
}

}  // namespace minipy
