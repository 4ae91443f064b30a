#include "../internal_helpers.h"

namespace minipy {

Value evaluate_case_index(const IndexExpr& index_expr, Interpreter& self,
                          const std::shared_ptr<Environment>& env) {
  const auto target = self.evaluate(*index_expr.target, env);
  const auto index = self.evaluate(*index_expr.index, env);
  auto& storage = expect_list_storage(target, "indexing");
  return storage[checked_list_index(index, storage.size())];
}

}  // namespace minipy
