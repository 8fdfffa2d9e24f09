#include <cassert>
#include <cmath>
#include <string>

#include "phase3/evaluator_parts/internal_helpers.h"
#include "../phase5_support.h"

namespace phase5_test {
namespace {

using arbor::Value;

void assert_close(double lhs, double rhs, double tol = 1e-12) { assert(std::fabs(lhs - rhs) <= tol); }

void test_catalog() {
  auto& registry = calculator_registry();
  for (const auto* name : {"add", "subtract", "multiply", "divide", "power", "sqrt", "greater_than", "less_than",
                           "equals", "average"}) {
    assert(registry.contains(name));
  }
  assert(registry.size() == 10);

  const auto tools = registry.list_tools();
  assert(tools.front().name == "add");
  const auto divide = registry.find_tool("divide");
  assert(divide.has_value());
  assert(divide->parameters.size() == 2);
  assert(divide->parameters[0].name == "a");
  assert(divide->parameters[1].name == "b");

  const auto schema = divide->parameter_schema();
  assert(schema["type"] == "object");
  assert(schema["properties"]["a"]["type"] == "number");
  assert(schema["required"].size() == 2);
  assert(!registry.find_tool("teleport").has_value());
}

void test_binary_arithmetic() {
  assert_close(call_number("add", {num(25), num(10)}), 35.0);
  assert_close(call_number("subtract", {num(50), num(8)}), 42.0);
  assert_close(call_number("multiply", {num(35), num(4)}), 140.0);
  assert_close(call_number("divide", {num(42), num(2)}), 21.0);
  assert_close(call_number("power", {num(3), num(2)}), 9.0);
  assert_close(call_number("power", {num(2), num(-1)}), 0.5);
  assert_close(call_number("sqrt", {num(140)}), 11.832159566199232);
  assert_close(call_number("sqrt", {num(0)}), 0.0);

  // Ints and numeric strings are accepted as operands.
  assert_close(call_number("add", {Value::int_value_of(2), Value::string_value_of(" 3.5 ")}), 5.5);
  assert(call_tool("add", {Value::int_value_of(1), Value::int_value_of(2)}).kind == Value::Kind::Double);
}

void test_comparisons() {
  assert(call_tool("greater_than", {num(93), num(100)}).kind == Value::Kind::Bool);
  assert(!call_tool("greater_than", {num(93), num(100)}).bool_value);
  assert(call_tool("greater_than", {num(101), num(100)}).bool_value);
  assert(call_tool("less_than", {num(1), num(3)}).bool_value);
  assert(!call_tool("less_than", {num(3), num(3)}).bool_value);
  assert(call_tool("equals", {Value::int_value_of(4), num(4.0)}).bool_value);
  assert(!call_tool("equals", {num(4), num(4.5)}).bool_value);
}

void test_average() {
  assert_close(call_number("average", {ints({1, 2, 3, 4})}), 2.5);
  assert_close(call_number("average", {ints({})}), 0.0);
  assert(call_error("average", {num(3)}).find("expects a list") != std::string::npos);
  assert(call_error("average", {Value::list_value_of({num(1), Value::string_value_of("x")})})
             .find("must be numeric") != std::string::npos);
}

void test_tool_failures() {
  assert(call_error("divide", {num(1), num(0)}).find("division by zero") != std::string::npos);
  assert(call_error("sqrt", {num(-4)}).find("negative") != std::string::npos);
  assert(call_error("add", {num(1)}).find("expects 2 argument(s), got 1") != std::string::npos);
  assert(call_error("add", {num(1), Value::bool_value_of(true)}).find("must be numeric") != std::string::npos);
  assert(call_error("add", {num(1), Value::string_value_of("ten")}).find("must be numeric") != std::string::npos);
  assert(call_error("teleport", {}).find("unknown tool") != std::string::npos);
}

void test_registry_lifecycle() {
  arbor::LocalToolRegistry registry;
  arbor::ToolDefinition echo;
  echo.name = "echo";
  echo.parameters = {{"text", "string", ""}};
  registry.register_tool(echo, [](const std::vector<Value>& args) { return args[0]; });
  assert(registry.call("echo", {Value::string_value_of("hi")}).string_value == "hi");

  bool duplicate = false;
  try {
    registry.register_tool(echo, [](const std::vector<Value>& args) { return args[0]; });
  } catch (const arbor::ToolInvocationError& err) {
    duplicate = true;
    assert(std::string(err.what()).find("already registered") != std::string::npos);
  }
  assert(duplicate);

  assert(registry.unregister_tool("echo"));
  assert(!registry.unregister_tool("echo"));
  assert(registry.size() == 0);
  assert(registry.list_tools().empty());
}

void test_numeric_backend_agrees_with_libm() {
  const std::string backend = arbor::numeric_backend_name();
  assert(backend == "mpfr" || backend == "libm");
  for (double base = 0.5; base < 20.0; base += 0.75) {
    assert_close(call_number("power", {num(base), num(1.5)}), std::pow(base, 1.5), 1e-9);
    assert_close(call_number("sqrt", {num(base)}), std::sqrt(base), 1e-12);
  }
}

}  // namespace

void run_calculator_tool_tests() {
  test_catalog();
  test_binary_arithmetic();
  test_comparisons();
  test_average();
  test_tool_failures();
  test_registry_lifecycle();
  test_numeric_backend_agrees_with_libm();
}

}  // namespace phase5_test
