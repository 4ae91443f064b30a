#include "../internal_helpers.h"

namespace minipy {

Value evaluate_case_bool(const BoolExpr& expr, Interpreter&,
                         const std::shared_ptr<Environment>&) {
  return Value::bool_value_of(expr.value);
}

Value evaluate_case_none(const NoneExpr&, Interpreter&,
                         const std::shared_ptr<Environment>&) {
  return Value::none();
}

}  // namespace minipy
