#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace arbor {

Value Value::nil() {
  Value value;
  value.kind = Kind::Nil;
  return value;
}

Value Value::bool_value_of(bool v) {
  Value value;
  value.kind = Kind::Bool;
  value.bool_value = v;
  return value;
}

Value Value::int_value_of(long long v) {
  Value value;
  value.kind = Kind::Int;
  value.int_value = v;
  return value;
}

Value Value::double_value_of(double v) {
  Value value;
  value.kind = Kind::Double;
  value.double_value = v;
  return value;
}

Value Value::string_value_of(std::string v) {
  Value value;
  value.kind = Kind::String;
  value.string_value = std::move(v);
  return value;
}

Value Value::list_value_of(std::vector<Value> values) {
  Value value;
  value.kind = Kind::List;
  value.list_value = std::move(values);
  return value;
}

Value Value::object_value_of(std::vector<std::pair<std::string, Value>> entries) {
  Value value;
  value.kind = Kind::Object;
  value.object_value = std::move(entries);
  return value;
}

Value Value::closure_value_of(NodeId lambda, std::vector<std::string> params, NodeId body) {
  Value value;
  value.kind = Kind::Closure;
  auto closure = std::make_shared<Closure>();
  closure->lambda = lambda;
  closure->params = std::move(params);
  closure->body = body;
  value.closure_value = std::move(closure);
  return value;
}

double Value::number() const {
  if (kind == Kind::Int) {
    return static_cast<double>(int_value);
  }
  if (kind == Kind::Double) {
    return double_value;
  }
  throw std::runtime_error(std::string("expected numeric value, got ") + value_kind_name(kind));
}

const Value* Value::field(const std::string& key) const {
  if (kind != Kind::Object) {
    return nullptr;
  }
  for (const auto& entry : object_value) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

const char* value_kind_name(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::Nil:
      return "nil";
    case Value::Kind::Bool:
      return "bool";
    case Value::Kind::Int:
      return "int";
    case Value::Kind::Double:
      return "double";
    case Value::Kind::String:
      return "string";
    case Value::Kind::List:
      return "list";
    case Value::Kind::Object:
      return "object";
    case Value::Kind::Closure:
      return "closure";
  }
  return "nil";
}

}  // namespace arbor
