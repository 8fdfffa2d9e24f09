#include <algorithm>
#include <mutex>
#include <utility>

#include "phase3/evaluator_parts/internal_helpers.h"

namespace arbor {

nlohmann::json ToolDefinition::parameter_schema() const {
  nlohmann::json properties = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();
  for (const auto& parameter : parameters) {
    nlohmann::json property = nlohmann::json::object();
    property["type"] = parameter.type.empty() ? "any" : parameter.type;
    if (!parameter.description.empty()) {
      property["description"] = parameter.description;
    }
    properties[parameter.name] = std::move(property);
    required.push_back(parameter.name);
  }
  nlohmann::json schema = nlohmann::json::object();
  schema["type"] = "object";
  schema["properties"] = std::move(properties);
  schema["required"] = std::move(required);
  return schema;
}

std::optional<ToolDefinition> ToolProvider::find_tool(const std::string& name) {
  for (auto& tool : list_tools()) {
    if (tool.name == name) {
      return std::move(tool);
    }
  }
  return std::nullopt;
}

void LocalToolRegistry::register_tool(ToolDefinition definition, ToolHandler handler) {
  if (definition.name.empty()) {
    throw ToolInvocationError("tool name must not be empty");
  }
  if (!handler) {
    throw ToolInvocationError("tool '" + definition.name + "' has no handler");
  }
  std::lock_guard<std::mutex> guard(mutex_);
  const auto name = definition.name;
  const auto [it, inserted] = tools_.emplace(name, Entry{std::move(definition), std::move(handler)});
  if (!inserted) {
    throw ToolInvocationError("tool '" + name + "' is already registered");
  }
  order_.push_back(name);
}

bool LocalToolRegistry::unregister_tool(const std::string& name) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (tools_.erase(name) == 0) {
    return false;
  }
  order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
  return true;
}

bool LocalToolRegistry::contains(const std::string& name) const {
  std::lock_guard<std::mutex> guard(mutex_);
  return tools_.count(name) > 0;
}

std::size_t LocalToolRegistry::size() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return tools_.size();
}

std::vector<ToolDefinition> LocalToolRegistry::list_tools() {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<ToolDefinition> out;
  out.reserve(order_.size());
  for (const auto& name : order_) {
    out.push_back(tools_.at(name).definition);
  }
  return out;
}

std::optional<ToolDefinition> LocalToolRegistry::find_tool(const std::string& name) {
  std::lock_guard<std::mutex> guard(mutex_);
  const auto it = tools_.find(name);
  if (it == tools_.end()) {
    return std::nullopt;
  }
  return it->second.definition;
}

Value LocalToolRegistry::call(const std::string& name, const std::vector<Value>& args) {
  ToolHandler handler;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto it = tools_.find(name);
    if (it == tools_.end()) {
      throw ToolInvocationError("unknown tool '" + name + "'");
    }
    const auto arity = it->second.definition.parameters.size();
    if (arity != args.size()) {
      throw ToolInvocationError("tool '" + name + "' expects " + std::to_string(arity) + " argument(s), got " +
                                std::to_string(args.size()));
    }
    handler = it->second.handler;
  }
  // Handlers run unlocked: they may be slow, and compiled tools re-enter the registry.
  return handler(args);
}

}  // namespace arbor
