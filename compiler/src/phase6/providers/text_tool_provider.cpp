#include <mutex>
#include <utility>

#include "phase3/evaluator_parts/internal_helpers.h"

namespace arbor {

Value decode_tool_output(const std::string& text) {
  // Plain text replies are common; only well-formed JSON is converted.
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return Value::string_value_of(text);
  }
  return value_from_json(parsed);
}

std::vector<ToolDefinition> TextToolProvider::list_tools() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!cached_) {
    tools_ = fetch_tools();
    cached_ = true;
  }
  return tools_;
}

std::optional<ToolDefinition> TextToolProvider::find_tool(const std::string& name) {
  for (auto& tool : list_tools()) {
    if (tool.name == name) {
      return std::move(tool);
    }
  }
  return std::nullopt;
}

void TextToolProvider::invalidate_tool_cache() {
  std::lock_guard<std::mutex> guard(mutex_);
  cached_ = false;
  tools_.clear();
}

Value TextToolProvider::call(const std::string& name, const std::vector<Value>& args) {
  const auto definition = find_tool(name);
  if (!definition.has_value()) {
    throw ToolInvocationError("unknown tool '" + name + "'");
  }
  if (definition->parameters.size() != args.size()) {
    throw ToolInvocationError("tool '" + name + "' expects " + std::to_string(definition->parameters.size()) +
                              " argument(s), got " + std::to_string(args.size()));
  }

  nlohmann::json named_args = nlohmann::json::object();
  for (std::size_t i = 0; i < args.size(); ++i) {
    named_args[definition->parameters[i].name] = value_to_json(args[i]);
  }

  const auto parts = call_text(name, named_args);
  if (parts.empty()) {
    return Value::nil();
  }
  if (parts.front().rfind("Error", 0) == 0) {
    throw ToolInvocationError("error calling tool '" + name + "': " + parts.front());
  }
  if (parts.size() == 1) {
    return decode_tool_output(parts.front());
  }
  std::string joined = "[";
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      joined += ",";
    }
    joined += parts[i];
  }
  joined += "]";
  return decode_tool_output(joined);
}

}  // namespace arbor
