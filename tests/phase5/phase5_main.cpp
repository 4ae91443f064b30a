#include "phase5_support.h"

namespace {

void verify_all() {
  phase5_test::run_value_model_tests();
  phase5_test::run_environment_tests();
  phase5_test::run_function_table_tests();
  phase5_test::run_list_container_tests();
  phase5_test::run_list_container_extreme_tests();
}

}  // namespace

int main() {
  verify_all();
  return 0;
}
