#include <cassert>
#include <sstream>
#include <string>

#include "phase5_support.h"

namespace {

void test_large_range_sum_matches_closed_form() {
  phase5_test::expect_global_int(R"(
total = 0
for v in range(5000):
    total = total + v
)", "total", 4999LL * 5000LL / 2);
}

void test_list_mutation_stress_integrity() {
  phase5_test::expect_global_int(R"(
xs = range(256)
for i in range(256):
    xs[i] = xs[i] * 2 + 1
total = 0
for v in xs:
    total = total + v
)", "total", 256LL * 256LL);
}

void test_loop_snapshot_ignores_replaced_binding() {
  phase5_test::expect_global_int(R"(
xs = [1, 2, 3]
count = 0
for x in xs:
    xs = [0]
    count = count + 1
)", "count", 3);
}

void test_deep_nesting() {
  std::ostringstream source;
  source << "x = ";
  for (int i = 0; i < 40; ++i) {
    source << "[";
  }
  source << "7";
  for (int i = 0; i < 40; ++i) {
    source << "]";
  }
  source << "\ny = x";
  for (int i = 0; i < 40; ++i) {
    source << "[0]";
  }
  source << "\n";
  phase5_test::expect_global_int(source.str(), "y", 7);
}

void test_recursive_list_builder() {
  phase5_test::expect_global_list(R"(
def build(n):
    if n == 0:
        return []
    return build(n - 1) + [n]
xs = build(6)
)", "xs", {1, 2, 3, 4, 5, 6});
}

}  // namespace

namespace phase5_test {

void run_list_container_extreme_tests() {
  test_large_range_sum_matches_closed_form();
  test_list_mutation_stress_integrity();
  test_loop_snapshot_ignores_replaced_binding();
  test_deep_nesting();
  test_recursive_list_builder();
}

}  // namespace phase5_test
