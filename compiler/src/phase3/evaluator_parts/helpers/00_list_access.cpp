#include <string>
#include <unordered_set>
#include <vector>

#include "../internal_helpers.h"

namespace minipy {

Value::ListStorage& expect_list_storage(const Value& target, const char* context) {
  if (target.kind != Value::Kind::List || !target.list_value) {
    throw EvalException(ErrorKind::TypeError,
                        std::string(context) + " expects a List, got " + value_kind_name(target.kind));
  }
  return *target.list_value;
}

// Valid indices are [0, size); negative indices do not wrap.
std::size_t checked_list_index(const Value& index, std::size_t size) {
  if (index.kind != Value::Kind::Int) {
    throw EvalException(ErrorKind::TypeError,
                        std::string("list index must be Int, got ") + value_kind_name(index.kind));
  }
  if (index.int_value < 0 || static_cast<unsigned long long>(index.int_value) >= size) {
    throw EvalException(ErrorKind::IndexError, "list index " + std::to_string(index.int_value) +
                                                   " out of range for length " + std::to_string(size));
  }
  return static_cast<std::size_t>(index.int_value);
}

// Element stores are the only way to link existing storages, and they refuse
// to close a cycle, so the walk below always terminates. Shared sub-lists are
// visited once.
bool list_storage_reaches(const Value& value, const Value::ListStorage* target) {
  if (value.kind != Value::Kind::List || !value.list_value || target == nullptr) {
    return false;
  }
  std::vector<const Value::ListStorage*> pending{value.list_value.get()};
  std::unordered_set<const Value::ListStorage*> seen;
  while (!pending.empty()) {
    const auto* storage = pending.back();
    pending.pop_back();
    if (storage == target) {
      return true;
    }
    if (!seen.insert(storage).second) {
      continue;
    }
    for (const auto& element : *storage) {
      if (element.kind == Value::Kind::List && element.list_value) {
        pending.push_back(element.list_value.get());
      }
    }
  }
  return false;
}

}  // namespace minipy
