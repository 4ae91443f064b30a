#include <vector>

#include "../internal_helpers.h"

namespace minipy {

Value evaluate_case_list(const ListExpr& list, Interpreter& self,
                         const std::shared_ptr<Environment>& env) {
  std::vector<Value> values;
  values.reserve(list.elements.size());
  for (const auto& element : list.elements) {
    values.push_back(self.evaluate(*element, env));
  }
  return Value::list_value_of(std::move(values));
}

}  // namespace minipy
