#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace arbor {

nlohmann::json value_to_json(const Value& value) {
  switch (value.kind) {
    case Value::Kind::Nil:
      return nullptr;
    case Value::Kind::Bool:
      return value.bool_value;
    case Value::Kind::Int:
      return value.int_value;
    case Value::Kind::Double:
      return value.double_value;
    case Value::Kind::String:
      return value.string_value;
    case Value::Kind::List: {
      auto out = nlohmann::json::array();
      for (const auto& item : value.list_value) {
        out.push_back(value_to_json(item));
      }
      return out;
    }
    case Value::Kind::Object: {
      auto out = nlohmann::json::object();
      for (const auto& entry : value.object_value) {
        out[entry.first] = value_to_json(entry.second);
      }
      return out;
    }
    case Value::Kind::Closure:
      return value.to_string();
  }
  return nullptr;
}

Value value_from_json(const nlohmann::json& json) {
  switch (json.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
      return Value::nil();
    case nlohmann::json::value_t::boolean:
      return Value::bool_value_of(json.get<bool>());
    case nlohmann::json::value_t::number_integer:
      return Value::int_value_of(json.get<long long>());
    case nlohmann::json::value_t::number_unsigned: {
      const auto raw = json.get<unsigned long long>();
      if (raw > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        return Value::double_value_of(static_cast<double>(raw));
      }
      return Value::int_value_of(static_cast<long long>(raw));
    }
    case nlohmann::json::value_t::number_float:
      return Value::double_value_of(json.get<double>());
    case nlohmann::json::value_t::string:
      return Value::string_value_of(json.get<std::string>());
    case nlohmann::json::value_t::array: {
      std::vector<Value> items;
      items.reserve(json.size());
      for (const auto& item : json) {
        items.push_back(value_from_json(item));
      }
      return Value::list_value_of(std::move(items));
    }
    case nlohmann::json::value_t::object: {
      std::vector<std::pair<std::string, Value>> entries;
      entries.reserve(json.size());
      for (auto it = json.begin(); it != json.end(); ++it) {
        entries.emplace_back(it.key(), value_from_json(it.value()));
      }
      return Value::object_value_of(std::move(entries));
    }
    case nlohmann::json::value_t::binary:
      break;
  }
  return Value::nil();
}

}  // namespace arbor
