#include <memory>
#include <string>
#include <vector>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace minipy {

Value Value::none() {
  Value value;
  value.kind = Kind::None;
  return value;
}

Value Value::int_value_of(long long v) {
  Value value;
  value.kind = Kind::Int;
  value.int_value = v;
  return value;
}

Value Value::bool_value_of(bool v) {
  Value value;
  value.kind = Kind::Bool;
  value.bool_value = v;
  return value;
}

Value Value::string_value_of(std::string v) {
  Value value;
  value.kind = Kind::String;
  value.string_value = std::move(v);
  return value;
}

Value Value::list_value_of(std::vector<Value> values) {
  Value value;
  value.kind = Kind::List;
  value.list_value = std::make_shared<ListStorage>(std::move(values));
  return value;
}

std::size_t Value::list_size() const {
  return kind == Kind::List && list_value ? list_value->size() : 0;
}

}  // namespace minipy
