#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

#include "../internal_helpers.h"

namespace arbor {

std::string double_to_string(double value) {
  if (std::isnan(value) || std::isinf(value)) {
    return std::to_string(value);
  }
  if (std::floor(value) == value && value >= static_cast<double>(std::numeric_limits<long long>::min()) &&
      value <= static_cast<double>(std::numeric_limits<long long>::max())) {
    std::ostringstream stream;
    stream << static_cast<long long>(value);
    return stream.str();
  }

  // Shortest of 15..17 significant digits that reads back exactly.
  std::string raw;
  for (int digits = std::numeric_limits<double>::digits10; digits <= std::numeric_limits<double>::max_digits10;
       ++digits) {
    std::ostringstream stream;
    stream << std::setprecision(digits) << value;
    raw = stream.str();
    if (std::strtod(raw.c_str(), nullptr) == value) {
      break;
    }
  }
  const auto exp_pos = raw.find_first_of("eE");
  std::string mantissa = exp_pos == std::string::npos ? raw : raw.substr(0, exp_pos);
  const std::string exponent = exp_pos == std::string::npos ? std::string() : raw.substr(exp_pos);

  if (mantissa.find('.') != std::string::npos) {
    while (!mantissa.empty() && mantissa.back() == '0') {
      mantissa.pop_back();
    }
    if (!mantissa.empty() && mantissa.back() == '.') {
      mantissa.pop_back();
    }
  }
  if (mantissa.empty() || mantissa == "-0") {
    mantissa = "0";
  }
  return mantissa + exponent;
}

bool value_is_truthy(const Value& value) {
  switch (value.kind) {
    case Value::Kind::Nil:
      return false;
    case Value::Kind::Bool:
      return value.bool_value;
    case Value::Kind::Int:
      return value.int_value != 0;
    case Value::Kind::Double:
      return value.double_value != 0.0 && !std::isnan(value.double_value);
    case Value::Kind::String:
      return !value.string_value.empty() && value.string_value != "false" && value.string_value != "False";
    case Value::Kind::List:
      return !value.list_value.empty();
    case Value::Kind::Object:
      return !value.object_value.empty();
    case Value::Kind::Closure:
      return true;
  }
  return false;
}

}  // namespace arbor
