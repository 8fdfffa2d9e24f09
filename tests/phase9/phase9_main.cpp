#include "phase9_support.h"

int main() {
  phase9_test::run_phase9_scheduler_tests();
  phase9_test::run_phase9_cancellation_tests();
  phase9_test::run_phase9_fanout_tests();
  return 0;
}
