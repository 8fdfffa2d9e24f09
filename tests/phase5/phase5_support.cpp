#include "phase5_support.h"

#include <cassert>
#include <utility>

namespace phase5_test {

arbor::LocalToolRegistry& calculator_registry() {
  static arbor::LocalToolRegistry registry;
  static const bool registered = [] {
    arbor::register_calculator_tools(registry);
    return true;
  }();
  (void)registered;
  return registry;
}

arbor::Value call_tool(const std::string& name, const std::vector<arbor::Value>& args) {
  return calculator_registry().call(name, args);
}

double call_number(const std::string& name, const std::vector<arbor::Value>& args) {
  const auto out = call_tool(name, args);
  assert(out.is_number());
  return out.number();
}

std::string call_error(const std::string& name, const std::vector<arbor::Value>& args) {
  try {
    (void)call_tool(name, args);
  } catch (const arbor::ToolInvocationError& err) {
    return err.what();
  }
  return std::string();
}

arbor::Value num(double value) { return arbor::Value::double_value_of(value); }

arbor::Value ints(const std::vector<long long>& values) {
  std::vector<arbor::Value> items;
  items.reserve(values.size());
  for (const auto value : values) {
    items.push_back(arbor::Value::int_value_of(value));
  }
  return arbor::Value::list_value_of(std::move(items));
}

}  // namespace phase5_test
