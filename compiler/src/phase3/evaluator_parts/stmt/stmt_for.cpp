#include <vector>

#include "../internal_helpers.h"

namespace minipy {

// The element sequence is copied when the loop starts. Stores made by the body
// still land in the shared list but do not change what the loop visits.
void execute_case_for(const ForStmt& stmt, Interpreter& self,
                      const std::shared_ptr<Environment>& env) {
  const auto iterable = self.evaluate(*stmt.iterable, env);
  const std::vector<Value> snapshot = expect_list_storage(iterable, "for loop");
  for (const auto& element : snapshot) {
    env->define(stmt.name, element);
    self.execute_block(stmt.body, env);
  }
}

}  // namespace minipy
