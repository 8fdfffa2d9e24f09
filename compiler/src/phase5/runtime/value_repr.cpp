#include <cmath>
#include <string>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace arbor {

std::string Value::to_string() const {
  switch (kind) {
    case Kind::Nil:
      return "null";
    case Kind::Bool:
      return bool_value ? "true" : "false";
    case Kind::Int:
      return std::to_string(int_value);
    case Kind::Double:
      return double_to_string(double_value);
    case Kind::String:
      return string_value;
    case Kind::List: {
      std::string out = "[";
      for (std::size_t i = 0; i < list_value.size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += list_value[i].to_string();
      }
      out += "]";
      return out;
    }
    case Kind::Object: {
      std::string out = "{";
      for (std::size_t i = 0; i < object_value.size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += object_value[i].first + ": " + object_value[i].second.to_string();
      }
      out += "}";
      return out;
    }
    case Kind::Closure:
      if (!closure_value) {
        return "<invalid lambda>";
      }
      return "<lambda/" + std::to_string(closure_value->params.size()) + ">";
  }

  return "null";
}

bool Value::equals(const Value& other) const {
  if (kind != other.kind) {
    if (is_number() && other.is_number()) {
      return number() == other.number();
    }
    return false;
  }

  switch (kind) {
    case Kind::Nil:
      return true;
    case Kind::Bool:
      return bool_value == other.bool_value;
    case Kind::Int:
      return int_value == other.int_value;
    case Kind::Double:
      return double_value == other.double_value;
    case Kind::String:
      return string_value == other.string_value;
    case Kind::List:
      if (list_value.size() != other.list_value.size()) {
        return false;
      }
      for (std::size_t i = 0; i < list_value.size(); ++i) {
        if (!list_value[i].equals(other.list_value[i])) {
          return false;
        }
      }
      return true;
    case Kind::Object:
      if (object_value.size() != other.object_value.size()) {
        return false;
      }
      for (const auto& entry : object_value) {
        const auto* rhs = other.field(entry.first);
        if (!rhs || !entry.second.equals(*rhs)) {
          return false;
        }
      }
      return true;
    case Kind::Closure:
      if (!closure_value || !other.closure_value) {
        return closure_value == other.closure_value;
      }
      return closure_value->lambda == other.closure_value->lambda;
  }

  return false;
}

}  // namespace arbor
