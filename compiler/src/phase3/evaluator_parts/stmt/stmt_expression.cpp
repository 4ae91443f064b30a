#include "../internal_helpers.h"

namespace minipy {

void execute_case_expression(const ExpressionStmt& stmt, Interpreter& self,
                             const std::shared_ptr<Environment>& env) {
  (void)self.evaluate(*stmt.expression, env);
}

void execute_case_print(const PrintStmt& stmt, Interpreter& self,
                        const std::shared_ptr<Environment>& env) {
  self.print_value(self.evaluate(*stmt.value, env));
}

}  // namespace minipy
