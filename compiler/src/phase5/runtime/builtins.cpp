#include <string>
#include <vector>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace minipy {

namespace {

Value builtin_len(const Value& arg) {
  if (arg.kind != Value::Kind::List) {
    throw EvalException(ErrorKind::TypeError, std::string("len() expects a List, got ") + value_kind_name(arg.kind));
  }
  return Value::int_value_of(static_cast<long long>(arg.list_size()));
}

Value builtin_range(const Value& arg) {
  if (arg.kind != Value::Kind::Int) {
    throw EvalException(ErrorKind::TypeError, std::string("range() expects an Int, got ") + value_kind_name(arg.kind));
  }
  if (arg.int_value < 0) {
    throw EvalException(ErrorKind::ValueError,
                        "range() argument must be non-negative, got " + std::to_string(arg.int_value));
  }
  std::vector<Value> result;
  result.reserve(static_cast<std::size_t>(arg.int_value));
  for (long long i = 0; i < arg.int_value; ++i) {
    result.push_back(Value::int_value_of(i));
  }
  return Value::list_value_of(std::move(result));
}

}  // namespace

bool is_builtin_function(const std::string& name) {
  return name == "len" || name == "range";
}

Value call_builtin_function(const std::string& name, const std::vector<Value>& args) {
  if (args.size() != 1) {
    throw EvalException(ErrorKind::ArityError, name + "() expects 1 argument, got " + std::to_string(args.size()));
  }
  if (name == "len") {
    return builtin_len(args.front());
  }
  if (name == "range") {
    return builtin_range(args.front());
  }
  throw EvalException(ErrorKind::NameError, "undefined function: " + name);
}

}  // namespace minipy
