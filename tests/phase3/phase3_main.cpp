#include "phase3_support.h"

int main() {
  phase3_test::run_phase3_eval_tests();
  phase3_test::run_phase3_higher_order_tests();
  phase3_test::run_phase3_error_tests();
  return 0;
}
