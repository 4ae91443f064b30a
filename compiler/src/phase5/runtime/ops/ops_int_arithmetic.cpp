#include "phase5/runtime/ops/runtime_ops.h"

#include <string>

namespace minipy::runtime_ops {

const char* binary_op_name(BinaryOp op) {
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Lte:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Gte:
      return ">=";
    case BinaryOp::And:
      return "and";
    case BinaryOp::Or:
      return "or";
  }
  return "?";
}

bool is_arithmetic_op(BinaryOp op) {
  return op == BinaryOp::Add || op == BinaryOp::Sub || op == BinaryOp::Mul ||
         op == BinaryOp::Div || op == BinaryOp::Mod;
}

long long wrapping_add(long long lhs, long long rhs) {
  return static_cast<long long>(static_cast<unsigned long long>(lhs) + static_cast<unsigned long long>(rhs));
}

long long wrapping_sub(long long lhs, long long rhs) {
  return static_cast<long long>(static_cast<unsigned long long>(lhs) - static_cast<unsigned long long>(rhs));
}

long long wrapping_mul(long long lhs, long long rhs) {
  return static_cast<long long>(static_cast<unsigned long long>(lhs) * static_cast<unsigned long long>(rhs));
}

long long wrapping_neg(long long value) {
  return static_cast<long long>(0ULL - static_cast<unsigned long long>(value));
}

// MIN / -1 is the one quotient that does not fit; it wraps back to MIN.
long long truncating_div(long long lhs, long long rhs) {
  if (rhs == -1) {
    return wrapping_neg(lhs);
  }
  return lhs / rhs;
}

long long truncating_mod(long long lhs, long long rhs) {
  if (rhs == -1) {
    return 0;
  }
  return lhs % rhs;
}

void throw_operand_type_error(BinaryOp op, const Value& left, const Value& right) {
  throw EvalException(ErrorKind::TypeError, std::string("unsupported operand types for ") + binary_op_name(op) +
                                                ": " + value_kind_name(left.kind) + " and " +
                                                value_kind_name(right.kind));
}

}  // namespace minipy::runtime_ops
