#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "arbor/evaluator.h"
#include "arbor/tool_provider.h"
#include "arbor/tree.h"
#include "arbor/value.h"

namespace arbor {

// Canonical env-flag parser shared by the evaluator, scheduler and tool layers.
inline bool parse_env_flag_value(const char* raw, bool fallback) {
  if (!raw || *raw == '\0') {
    return fallback;
  }
  const std::string value(raw);
  if (value == "0" || value == "false" || value == "False" || value == "off" ||
      value == "OFF" || value == "no" || value == "NO") {
    return false;
  }
  return true;
}

inline bool env_flag_enabled(const char* name, bool fallback) {
  return parse_env_flag_value(std::getenv(name), fallback);
}

// Unset, empty or non-numeric values read as nullopt.
inline std::optional<long long> env_integer_value(const char* name) {
  const auto* raw = std::getenv(name);
  if (!raw || *raw == '\0') {
    return std::nullopt;
  }
  char* end = nullptr;
  const auto parsed = std::strtoll(raw, &end, 10);
  if (end == raw || (end && *end != '\0')) {
    return std::nullopt;
  }
  return parsed;
}

std::string double_to_string(double value);
bool value_is_truthy(const Value& value);

// Numeric tool core (phase5 primitives).
double tool_number_arg(const std::string& tool, const std::vector<Value>& args, std::size_t index);
void require_tool_arity(const std::string& tool, const std::vector<Value>& args, std::size_t arity);
double numeric_power(double base, double exponent);
double numeric_sqrt(double value);
const char* numeric_backend_name();

}  // namespace arbor
