#include "../internal_helpers.h"

namespace minipy {

namespace {

bool expect_bool_operand(const Value& value, const char* op_name) {
  if (value.kind != Value::Kind::Bool) {
    throw EvalException(ErrorKind::TypeError, std::string("'") + op_name + "' expects Bool operands, got " +
                                                  value_kind_name(value.kind));
  }
  return value.bool_value;
}

}  // namespace

// Left operand is always evaluated first. `and` short-circuits; `or` does too
// unless the interpreter runs with eager `or`.
Value evaluate_case_binary(const BinaryExpr& binary, Interpreter& self,
                           const std::shared_ptr<Environment>& env) {
  if (binary.op == BinaryOp::And) {
    if (!expect_bool_operand(self.evaluate(*binary.left, env), "and")) {
      return Value::bool_value_of(false);
    }
    return Value::bool_value_of(expect_bool_operand(self.evaluate(*binary.right, env), "and"));
  }

  if (binary.op == BinaryOp::Or) {
    const bool lhs = expect_bool_operand(self.evaluate(*binary.left, env), "or");
    if (lhs && self.options().short_circuit_or) {
      return Value::bool_value_of(true);
    }
    const bool rhs = expect_bool_operand(self.evaluate(*binary.right, env), "or");
    return Value::bool_value_of(lhs || rhs);
  }

  auto left = self.evaluate(*binary.left, env);
  auto right = self.evaluate(*binary.right, env);
  return self.eval_binary(binary.op, left, right);
}

}  // namespace minipy
