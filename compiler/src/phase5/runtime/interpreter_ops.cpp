#include "phase5/runtime/ops/runtime_ops.h"

#include "phase3/evaluator_parts/internal_helpers.h"

namespace minipy {

// Keep Interpreter entry-points thin; operator semantics live in phase5/runtime/ops/*.
bool Interpreter::truthy(const Value& value) {
  switch (value.kind) {
    case Value::Kind::None:
      return false;
    case Value::Kind::Bool:
      return value.bool_value;
    case Value::Kind::Int:
      return value.int_value != 0;
    case Value::Kind::String:
      return !value.string_value.empty();
    case Value::Kind::List:
      return value.list_size() != 0;
  }
  return true;
}

Value Interpreter::eval_unary(UnaryOp op, const Value& operand) const {
  return runtime_ops::controllers::eval_unary_orchestrator(op, operand);
}

Value Interpreter::eval_binary(BinaryOp op, const Value& left, const Value& right) const {
  return runtime_ops::controllers::eval_binary_orchestrator(op, left, right);
}

}  // namespace minipy
