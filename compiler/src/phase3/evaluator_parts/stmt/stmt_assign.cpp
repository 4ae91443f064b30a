#include "../internal_helpers.h"

namespace minipy {

namespace {

// e1[e2] = e3 evaluates e1, e2, then e3, and writes through the shared storage.
// A list may not be stored into itself, directly or through nested lists.
void assign_list_element(const IndexExpr& target, const Expr& value_expr, Interpreter& self,
                         const std::shared_ptr<Environment>& env) {
  const auto container = self.evaluate(*target.target, env);
  const auto index = self.evaluate(*target.index, env);
  auto value = self.evaluate(value_expr, env);
  auto& storage = expect_list_storage(container, "element assignment");
  const auto slot = checked_list_index(index, storage.size());
  if (list_storage_reaches(value, &storage)) {
    throw EvalException(ErrorKind::ValueError, "cannot store a list inside itself");
  }
  storage[slot] = std::move(value);
}

}  // namespace

void execute_case_assign(const AssignStmt& assign, Interpreter& self,
                         const std::shared_ptr<Environment>& env) {
  if (assign.target->kind == Expr::Kind::Variable) {
    const auto& variable = static_cast<const VariableExpr&>(*assign.target);
    env->define(variable.name, self.evaluate(*assign.value, env));
    return;
  }
  if (assign.target->kind == Expr::Kind::Index) {
    assign_list_element(static_cast<const IndexExpr&>(*assign.target), *assign.value, self, env);
    return;
  }
  throw EvalException(ErrorKind::TypeError, "invalid assignment target");
}

}  // namespace minipy
