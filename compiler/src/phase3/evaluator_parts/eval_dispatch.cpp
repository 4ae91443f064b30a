#include "internal_helpers.h"

namespace minipy {

Value Interpreter::evaluate(const Expr& expr, const std::shared_ptr<Environment>& env) {
  return execute_expr_fast(expr, *this, env);
}

void Interpreter::execute(const Stmt& stmt, const std::shared_ptr<Environment>& env) {
  execute_stmt_fast(stmt, *this, env);
}

// Blocks share the enclosing environment.
void Interpreter::execute_block(const StmtList& body, const std::shared_ptr<Environment>& env) {
  for (const auto& child : body) {
    execute_stmt_fast(*child, *this, env);
  }
}

}  // namespace minipy
