#include "../internal_helpers.h"

namespace minipy {

Value evaluate_case_int(const IntExpr& expr, Interpreter&,
                        const std::shared_ptr<Environment>&) {
  return Value::int_value_of(expr.value);
}

}  // namespace minipy
