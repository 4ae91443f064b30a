#include <vector>

#include "../internal_helpers.h"

namespace minipy {

// The spread is decided by the shape of the left operand, never by its value:
// `[a, b] | f` is f(a, b) while `xs | f` is f(xs) even when xs holds a list.
Value evaluate_case_pipe(const PipeExpr& pipe, Interpreter& self,
                         const std::shared_ptr<Environment>& env) {
  std::vector<const Expr*> args;
  if (pipe.input->kind == Expr::Kind::List) {
    const auto& literal = static_cast<const ListExpr&>(*pipe.input);
    args.reserve(literal.elements.size());
    for (const auto& element : literal.elements) {
      args.push_back(element.get());
    }
  } else {
    args.push_back(pipe.input.get());
  }
  return self.call_function(pipe.callee, args, env);
}

}  // namespace minipy
