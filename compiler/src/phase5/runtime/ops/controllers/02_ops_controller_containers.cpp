#include "phase5/runtime/ops/runtime_ops.h"

#include <optional>

namespace minipy::runtime_ops::controllers {

// String + String and List + List are the only container operations.
std::optional<Value> try_eval_binary_container(const BinaryOp op, const Value& left, const Value& right) {
  if (left.kind == Value::Kind::String && right.kind == Value::Kind::String) {
    if (op != BinaryOp::Add) {
      throw_operand_type_error(op, left, right);
    }
    return Value::string_value_of(left.string_value + right.string_value);
  }

  if (left.kind == Value::Kind::List && right.kind == Value::Kind::List) {
    if (op != BinaryOp::Add) {
      throw_operand_type_error(op, left, right);
    }
    return concat_lists(left, right);
  }

  return std::nullopt;
}

}  // namespace minipy::runtime_ops::controllers
