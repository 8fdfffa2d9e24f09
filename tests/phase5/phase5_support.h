#pragma once

#include <string>
#include <vector>

#include "arbor/tool_provider.h"
#include "arbor/value.h"

namespace phase5_test {

arbor::LocalToolRegistry& calculator_registry();
arbor::Value call_tool(const std::string& name, const std::vector<arbor::Value>& args);
double call_number(const std::string& name, const std::vector<arbor::Value>& args);
// Message of the ToolInvocationError the call raised; "" when it succeeded.
std::string call_error(const std::string& name, const std::vector<arbor::Value>& args);

arbor::Value num(double value);
arbor::Value ints(const std::vector<long long>& values);

void run_calculator_tool_tests();
void run_value_model_tests();

}  // namespace phase5_test
