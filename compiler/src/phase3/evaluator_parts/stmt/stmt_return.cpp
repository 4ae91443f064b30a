#include "../internal_helpers.h"

namespace minipy {

void execute_case_return(const ReturnStmt& stmt, Interpreter& self,
                         const std::shared_ptr<Environment>& env) {
  throw Interpreter::ReturnSignal{self.evaluate(*stmt.value, env)};
}

}  // namespace minipy
