#include <cstdio>
#include <string>
#include <vector>

#include "../internal_helpers.h"

namespace minipy {

namespace {

std::string arity_message(const std::string& name, std::size_t expected, std::size_t got) {
  return name + "() expects " + std::to_string(expected) + " argument" + (expected == 1 ? "" : "s") +
         ", got " + std::to_string(got);
}

struct CallDepthGuard {
  explicit CallDepthGuard(std::size_t& depth_ref) : depth(depth_ref) { ++depth; }
  ~CallDepthGuard() { --depth; }
  CallDepthGuard(const CallDepthGuard&) = delete;
  CallDepthGuard& operator=(const CallDepthGuard&) = delete;

  std::size_t& depth;
};

}  // namespace

Value evaluate_case_call(const CallExpr& call, Interpreter& self,
                         const std::shared_ptr<Environment>& env) {
  std::vector<const Expr*> args;
  args.reserve(call.args.size());
  for (const auto& arg : call.args) {
    args.push_back(arg.get());
  }
  return self.call_function(call.callee, args, env);
}

// Call protocol: resolve the callee, check arity, evaluate arguments left to
// right in the caller's environment, then run the body in a fresh activation.
// A ReturnSignal stops exactly here; falling off the end yields None.
Value Interpreter::call_function(const std::string& name, const std::vector<const Expr*>& args,
                                 const std::shared_ptr<Environment>& env) {
  if (is_builtin_function(name)) {
    if (args.size() != 1) {
      throw EvalException(ErrorKind::ArityError, arity_message(name, 1, args.size()));
    }
    std::vector<Value> values;
    values.push_back(evaluate(*args.front(), env));
    return call_builtin_function(name, values);
  }

  const auto* fn = function_table.find(name);
  if (!fn) {
    throw EvalException(ErrorKind::NameError, "undefined function: " + name);
  }
  if (fn->params.size() != args.size()) {
    throw EvalException(ErrorKind::ArityError, arity_message(name, fn->params.size(), args.size()));
  }
  if (call_depth >= opts.max_call_depth) {
    throw EvalException(ErrorKind::RecursionError,
                        "maximum call depth " + std::to_string(opts.max_call_depth) + " exceeded in " + name);
  }

  std::vector<Value> values;
  values.reserve(args.size());
  for (const auto* arg : args) {
    values.push_back(evaluate(*arg, env));
  }

  auto local_env = opts.call_scope == CallScope::CallerCopy ? env->clone() : std::make_shared<Environment>();
  for (std::size_t i = 0; i < fn->params.size(); ++i) {
    local_env->define(fn->params[i], std::move(values[i]));
  }

  CallDepthGuard guard(call_depth);
  if (opts.trace_calls) {
    std::fprintf(stderr, "[minipy-call] enter %s argc=%zu depth=%zu\n", name.c_str(), args.size(), call_depth);
  }

  Value result = Value::none();
  try {
    execute_block(*fn->body, local_env);
  } catch (const ReturnSignal& signal) {
    result = signal.value;
  }

  if (opts.trace_calls) {
    std::fprintf(stderr, "[minipy-call] leave %s depth=%zu\n", name.c_str(), call_depth);
  }
  return result;
}

}  // namespace minipy
