#include "phase9_support.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <thread>
#include <utility>

namespace phase9_test {

SlowProvider::SlowProvider(int delay_ms) : delay_ms_(delay_ms) { arbor::register_calculator_tools(registry_); }

std::vector<arbor::ToolDefinition> SlowProvider::list_tools() { return registry_.list_tools(); }

arbor::Value SlowProvider::call(const std::string& name, const std::vector<arbor::Value>& args) {
  calls_.fetch_add(1);
  const auto now = in_flight_.fetch_add(1) + 1;
  auto seen = peak_.load();
  while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
  in_flight_.fetch_sub(1);
  return registry_.call(name, args);
}

double as_number(const arbor::Value& value) {
  assert(value.is_number());
  return value.number();
}

void assert_close(double lhs, double rhs, double tol) { assert(std::fabs(lhs - rhs) <= tol); }

arbor::EvalOptions parallel_options(std::size_t max_inflight) {
  arbor::EvalOptions options;
  options.parallel = true;
  options.max_inflight_calls = max_inflight;
  return options;
}

arbor::Tree build_doubling_map(std::size_t count) {
  arbor::Tree tree;
  const auto x = tree.add_placeholder("x");
  const auto two = tree.add_value("b", arbor::Value::int_value_of(2));
  const auto body = tree.add_function("multiply", {x, two});
  const auto fn = tree.add_lambda({"x"}, body);
  std::vector<arbor::Value> items;
  for (std::size_t i = 1; i <= count; ++i) {
    items.push_back(arbor::Value::int_value_of(static_cast<long long>(i)));
  }
  const auto iterable = tree.add_value("items", arbor::Value::list_value_of(std::move(items)));
  tree.add_map(fn, iterable);
  return tree;
}

}  // namespace phase9_test
