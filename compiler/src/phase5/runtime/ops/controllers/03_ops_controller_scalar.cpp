#include "phase5/runtime/ops/runtime_ops.h"

namespace minipy::runtime_ops::controllers {

Value eval_binary_scalar_controller(const BinaryOp op, const Value& left, const Value& right) {
  if (left.kind != Value::Kind::Int || right.kind != Value::Kind::Int) {
    throw_operand_type_error(op, left, right);
  }

  const long long lhs = left.int_value;
  const long long rhs = right.int_value;
  switch (op) {
    case BinaryOp::Add:
      return Value::int_value_of(wrapping_add(lhs, rhs));
    case BinaryOp::Sub:
      return Value::int_value_of(wrapping_sub(lhs, rhs));
    case BinaryOp::Mul:
      return Value::int_value_of(wrapping_mul(lhs, rhs));
    case BinaryOp::Div:
      if (rhs == 0) {
        throw EvalException(ErrorKind::DivisionError, "integer division by zero");
      }
      return Value::int_value_of(truncating_div(lhs, rhs));
    case BinaryOp::Mod:
      if (rhs == 0) {
        throw EvalException(ErrorKind::DivisionError, "integer modulo by zero");
      }
      return Value::int_value_of(truncating_mod(lhs, rhs));
    default:
      break;
  }
  throw_operand_type_error(op, left, right);
}

}  // namespace minipy::runtime_ops::controllers
