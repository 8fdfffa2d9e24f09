#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace arbor {

// Stable node identity: the index of a node inside its tree arena.
using NodeId = std::uint32_t;
inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

struct Value {
  enum class Kind {
    Nil,
    Bool,
    Int,
    Double,
    String,
    List,
    Object,
    Closure,
  };

  // A lambda evaluated on its own. The body stays owned by the tree.
  struct Closure {
    NodeId lambda = kNoNode;
    std::vector<std::string> params;
    NodeId body = kNoNode;
  };

  Kind kind = Kind::Nil;
  bool bool_value = false;
  long long int_value = 0;
  double double_value = 0.0;
  std::string string_value;
  std::vector<Value> list_value;
  std::vector<std::pair<std::string, Value>> object_value;
  std::shared_ptr<const Closure> closure_value;

  static Value nil();
  static Value bool_value_of(bool v);
  static Value int_value_of(long long v);
  static Value double_value_of(double v);
  static Value string_value_of(std::string v);
  static Value list_value_of(std::vector<Value> values);
  static Value object_value_of(std::vector<std::pair<std::string, Value>> entries);
  static Value closure_value_of(NodeId lambda, std::vector<std::string> params, NodeId body);

  bool is_number() const { return kind == Kind::Int || kind == Kind::Double; }
  double number() const;
  const Value* field(const std::string& key) const;

  std::string to_string() const;
  bool equals(const Value& other) const;
};

const char* value_kind_name(Value::Kind kind);

nlohmann::json value_to_json(const Value& value);
Value value_from_json(const nlohmann::json& json);

}  // namespace arbor
