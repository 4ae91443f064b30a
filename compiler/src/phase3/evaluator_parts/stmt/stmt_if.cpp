#include "../internal_helpers.h"

namespace minipy {

void execute_case_if(const IfStmt& if_stmt, Interpreter& self,
                     const std::shared_ptr<Environment>& env) {
  if (Interpreter::truthy(self.evaluate(*if_stmt.condition, env))) {
    self.execute_block(if_stmt.then_body, env);
    return;
  }
  self.execute_block(if_stmt.else_body, env);
}

}  // namespace minipy
