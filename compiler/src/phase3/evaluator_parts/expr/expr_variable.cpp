#include "../internal_helpers.h"

namespace minipy {

Value evaluate_case_variable(const VariableExpr& expr, Interpreter&,
                             const std::shared_ptr<Environment>& env) {
  if (const auto* value = env->get_ptr(expr.name); value != nullptr) {
    return *value;
  }
  throw EvalException(ErrorKind::NameError, "undefined variable: " + expr.name);
}

}  // namespace minipy
