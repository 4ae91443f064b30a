#pragma once

#include <optional>

#include "minipy/evaluator.h"

namespace minipy::runtime_ops {

const char* binary_op_name(BinaryOp op);
bool is_arithmetic_op(BinaryOp op);

// 64-bit two's complement arithmetic; overflow wraps instead of trapping.
long long wrapping_add(long long lhs, long long rhs);
long long wrapping_sub(long long lhs, long long rhs);
long long wrapping_mul(long long lhs, long long rhs);
long long wrapping_neg(long long value);
// Truncating division/remainder. rhs must be non-zero.
long long truncating_div(long long lhs, long long rhs);
long long truncating_mod(long long lhs, long long rhs);

[[noreturn]] void throw_operand_type_error(BinaryOp op, const Value& left, const Value& right);

Value concat_lists(const Value& left, const Value& right);

namespace controllers {

std::optional<Value> try_eval_binary_core(BinaryOp op, const Value& left, const Value& right);
std::optional<Value> try_eval_binary_container(BinaryOp op, const Value& left, const Value& right);
Value eval_binary_scalar_controller(BinaryOp op, const Value& left, const Value& right);

Value eval_unary_orchestrator(UnaryOp op, const Value& operand);
Value eval_binary_orchestrator(BinaryOp op, const Value& left, const Value& right);

}  // namespace controllers

}  // namespace minipy::runtime_ops
