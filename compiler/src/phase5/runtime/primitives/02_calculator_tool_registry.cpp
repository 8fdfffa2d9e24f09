#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "phase3/evaluator_parts/internal_helpers.h"

namespace arbor {

namespace {

using BinaryKernel = std::function<Value(double, double)>;

ToolDefinition binary_definition(const std::string& name, const std::string& description) {
  ToolDefinition definition;
  definition.name = name;
  definition.description = description;
  definition.parameters = {{"a", "number", "first operand"}, {"b", "number", "second operand"}};
  return definition;
}

void register_binary(LocalToolRegistry& registry, const std::string& name, const std::string& description,
                     BinaryKernel kernel) {
  registry.register_tool(binary_definition(name, description),
                         [name, kernel = std::move(kernel)](const std::vector<Value>& args) {
                           require_tool_arity(name, args, 2);
                           return kernel(tool_number_arg(name, args, 0), tool_number_arg(name, args, 1));
                         });
}

}  // namespace

void register_calculator_tools(LocalToolRegistry& registry) {
  register_binary(registry, "add", "Add two numbers.",
                  [](double a, double b) { return Value::double_value_of(a + b); });
  register_binary(registry, "subtract", "Subtract the second number from the first.",
                  [](double a, double b) { return Value::double_value_of(a - b); });
  register_binary(registry, "multiply", "Multiply two numbers.",
                  [](double a, double b) { return Value::double_value_of(a * b); });
  register_binary(registry, "divide", "Divide the first number by the second.", [](double a, double b) {
    if (b == 0.0) {
      throw ToolInvocationError("divide() division by zero");
    }
    return Value::double_value_of(a / b);
  });
  register_binary(registry, "power", "Raise the first number to the power of the second.",
                  [](double a, double b) { return Value::double_value_of(numeric_power(a, b)); });
  register_binary(registry, "greater_than", "Return true when the first number is greater than the second.",
                  [](double a, double b) { return Value::bool_value_of(a > b); });
  register_binary(registry, "less_than", "Return true when the first number is less than the second.",
                  [](double a, double b) { return Value::bool_value_of(a < b); });
  register_binary(registry, "equals", "Return true when both numbers are equal.",
                  [](double a, double b) { return Value::bool_value_of(a == b); });

  ToolDefinition sqrt_definition;
  sqrt_definition.name = "sqrt";
  sqrt_definition.description = "Square root of a non-negative number.";
  sqrt_definition.parameters = {{"a", "number", "operand"}};
  registry.register_tool(std::move(sqrt_definition), [](const std::vector<Value>& args) {
    require_tool_arity("sqrt", args, 1);
    const auto operand = tool_number_arg("sqrt", args, 0);
    if (operand < 0.0) {
      throw ToolInvocationError("sqrt() cannot take the square root of a negative number");
    }
    return Value::double_value_of(numeric_sqrt(operand));
  });

  ToolDefinition average_definition;
  average_definition.name = "average";
  average_definition.description = "Arithmetic mean of a list of numbers (0 for an empty list).";
  average_definition.parameters = {{"numbers", "array", "numbers to average"}};
  registry.register_tool(std::move(average_definition), [](const std::vector<Value>& args) {
    require_tool_arity("average", args, 1);
    if (args[0].kind != Value::Kind::List) {
      throw ToolInvocationError(std::string("average() expects a list, got ") + value_kind_name(args[0].kind));
    }
    const auto& items = args[0].list_value;
    if (items.empty()) {
      return Value::double_value_of(0.0);
    }
    double total = 0.0;
    for (std::size_t i = 0; i < items.size(); ++i) {
      total += tool_number_arg("average", items, i);
    }
    return Value::double_value_of(total / static_cast<double>(items.size()));
  });
}

}  // namespace arbor
