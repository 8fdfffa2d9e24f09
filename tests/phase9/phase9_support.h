#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "arbor/evaluator.h"
#include "arbor/tool_provider.h"
#include "arbor/tree.h"

namespace phase9_test {

// Calculator whose calls sleep, recording how many run at once.
class SlowProvider : public arbor::ToolProvider {
 public:
  explicit SlowProvider(int delay_ms);

  std::vector<arbor::ToolDefinition> list_tools() override;
  arbor::Value call(const std::string& name, const std::vector<arbor::Value>& args) override;

  std::size_t calls() const { return calls_.load(); }
  std::size_t peak_in_flight() const { return peak_.load(); }

 private:
  int delay_ms_;
  arbor::LocalToolRegistry registry_;
  std::atomic<std::size_t> calls_{0};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> peak_{0};
};

double as_number(const arbor::Value& value);
void assert_close(double lhs, double rhs, double tol = 1e-9);
arbor::EvalOptions parallel_options(std::size_t max_inflight);
// map(lambda x: multiply(x, 2), [1..count])
arbor::Tree build_doubling_map(std::size_t count);

void run_phase9_scheduler_tests();
void run_phase9_cancellation_tests();
void run_phase9_fanout_tests();

}  // namespace phase9_test
