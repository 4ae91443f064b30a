#include "phase5/runtime/ops/runtime_ops.h"

#include <string>
#include <utility>

namespace minipy::runtime_ops::controllers {

Value eval_unary_orchestrator(const UnaryOp op, const Value& operand) {
  switch (op) {
    case UnaryOp::Neg:
      if (operand.kind != Value::Kind::Int) {
        throw EvalException(ErrorKind::TypeError,
                            std::string("unary - expects Int, got ") + value_kind_name(operand.kind));
      }
      return Value::int_value_of(wrapping_neg(operand.int_value));
    case UnaryOp::Not:
      if (operand.kind != Value::Kind::Bool) {
        throw EvalException(ErrorKind::TypeError,
                            std::string("'not' expects Bool, got ") + value_kind_name(operand.kind));
      }
      return Value::bool_value_of(!operand.bool_value);
  }

  return Value::none();
}

Value eval_binary_orchestrator(const BinaryOp op, const Value& left, const Value& right) {
  if (left.kind == Value::Kind::Int && right.kind == Value::Kind::Int && is_arithmetic_op(op)) {
    return eval_binary_scalar_controller(op, left, right);
  }

  if (auto out = try_eval_binary_core(op, left, right); out.has_value()) {
    return std::move(*out);
  }

  if (auto out = try_eval_binary_container(op, left, right); out.has_value()) {
    return std::move(*out);
  }

  return eval_binary_scalar_controller(op, left, right);
}

}  // namespace minipy::runtime_ops::controllers
