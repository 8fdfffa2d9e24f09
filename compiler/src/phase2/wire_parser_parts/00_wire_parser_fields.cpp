#include <initializer_list>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "arbor/wire.h"

namespace {

using json = nlohmann::json;

arbor::ParseError parse_error(const std::string& path, const std::string& operation, const std::string& message) {
  const std::string where = path.empty() ? "/" : path;
  return arbor::ParseError(operation + " at " + where + ": " + message, where, operation);
}

std::string child_path(const std::string& path, const std::string& key) { return path + "/" + key; }

std::string child_path(const std::string& path, std::size_t index) { return path + "/" + std::to_string(index); }

// Wire label or type, whichever identifies the node best in a diagnostic.
std::string wire_operation(const json& node) {
  if (node.is_object()) {
    if (const auto it = node.find("id"); it != node.end() && it->is_string()) {
      return it->get<std::string>();
    }
    if (const auto it = node.find("type"); it != node.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return "node";
}

const json* find_field(const json& node, std::initializer_list<const char*> keys) {
  for (const auto* key : keys) {
    if (const auto it = node.find(key); it != node.end()) {
      return &*it;
    }
  }
  return nullptr;
}

const json& require_field(const json& node, std::initializer_list<const char*> keys, const std::string& path) {
  if (const auto* field = find_field(node, keys)) {
    return *field;
  }
  throw parse_error(path, wire_operation(node), std::string("missing required field '") + *keys.begin() + "'");
}

std::string require_string(const json& node, const char* key, const std::string& path) {
  const auto& field = require_field(node, {key}, path);
  if (!field.is_string()) {
    throw parse_error(child_path(path, key), wire_operation(node), std::string("field '") + key + "' must be a string");
  }
  return field.get<std::string>();
}

std::string optional_string(const json& node, const char* key, const std::string& path) {
  const auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return std::string();
  }
  if (!it->is_string()) {
    throw parse_error(child_path(path, key), wire_operation(node), std::string("field '") + key + "' must be a string");
  }
  return it->get<std::string>();
}

}  // namespace
