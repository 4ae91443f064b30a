#include "phase5/runtime/ops/runtime_ops.h"

#include <optional>

namespace minipy::runtime_ops::controllers {

// Equality and ordering are total over every tag. `and`/`or` never arrive
// here; the expression evaluator owns their evaluation order.
std::optional<Value> try_eval_binary_core(const BinaryOp op, const Value& left, const Value& right) {
  switch (op) {
    case BinaryOp::Eq:
      return Value::bool_value_of(left.equals(right));
    case BinaryOp::Ne:
      return Value::bool_value_of(!left.equals(right));
    case BinaryOp::Lt:
      return Value::bool_value_of(left.compare(right) < 0);
    case BinaryOp::Lte:
      return Value::bool_value_of(left.compare(right) <= 0);
    case BinaryOp::Gt:
      return Value::bool_value_of(left.compare(right) > 0);
    case BinaryOp::Gte:
      return Value::bool_value_of(left.compare(right) >= 0);
    default:
      return std::nullopt;
  }
}

}  // namespace minipy::runtime_ops::controllers
