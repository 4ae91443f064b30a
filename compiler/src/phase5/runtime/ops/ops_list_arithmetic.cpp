#include "phase5/runtime/ops/runtime_ops.h"

#include <vector>

namespace minipy::runtime_ops {

// Produces a fresh list; neither operand's storage is shared with the result.
Value concat_lists(const Value& left, const Value& right) {
  std::vector<Value> result;
  result.reserve(left.list_size() + right.list_size());
  if (left.list_value) {
    result.insert(result.end(), left.list_value->begin(), left.list_value->end());
  }
  if (right.list_value) {
    result.insert(result.end(), right.list_value->begin(), right.list_value->end());
  }
  return Value::list_value_of(std::move(result));
}

}  // namespace minipy::runtime_ops
