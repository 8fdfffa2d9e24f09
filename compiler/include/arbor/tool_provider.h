#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "arbor/value.h"

namespace arbor {

struct ToolInvocationError : public std::runtime_error {
  explicit ToolInvocationError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

struct ToolParameter {
  std::string name;
  std::string type;
  std::string description;
};

struct ToolDefinition {
  std::string name;
  std::string description;
  std::vector<ToolParameter> parameters;

  nlohmann::json parameter_schema() const;
};

// Boundary the evaluator calls to run a named primitive operation.
// Implementations must tolerate concurrent calls.
class ToolProvider {
 public:
  virtual ~ToolProvider() = default;

  virtual std::vector<ToolDefinition> list_tools() = 0;
  virtual Value call(const std::string& name, const std::vector<Value>& args) = 0;
  virtual std::optional<ToolDefinition> find_tool(const std::string& name);
};

using ToolHandler = std::function<Value(const std::vector<Value>&)>;

class LocalToolRegistry : public ToolProvider {
 public:
  LocalToolRegistry() = default;

  void register_tool(ToolDefinition definition, ToolHandler handler);
  bool unregister_tool(const std::string& name);
  bool contains(const std::string& name) const;
  std::size_t size() const;

  std::vector<ToolDefinition> list_tools() override;
  Value call(const std::string& name, const std::vector<Value>& args) override;
  std::optional<ToolDefinition> find_tool(const std::string& name) override;

 private:
  struct Entry {
    ToolDefinition definition;
    ToolHandler handler;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> order_;
  std::unordered_map<std::string, Entry> tools_;
};

// Adapter for transports that exchange named JSON arguments for text content
// parts (the shape of MCP-style tool servers).
class TextToolProvider : public ToolProvider {
 public:
  std::vector<ToolDefinition> list_tools() override;
  Value call(const std::string& name, const std::vector<Value>& args) override;
  std::optional<ToolDefinition> find_tool(const std::string& name) override;

  void invalidate_tool_cache();

 protected:
  virtual std::vector<ToolDefinition> fetch_tools() = 0;
  virtual std::vector<std::string> call_text(const std::string& name,
                                             const nlohmann::json& named_args) = 0;

 private:
  std::mutex mutex_;
  bool cached_ = false;
  std::vector<ToolDefinition> tools_;
};

// JSON when decodable; otherwise the raw text as a String value.
Value decode_tool_output(const std::string& text);

void register_calculator_tools(LocalToolRegistry& registry);

}  // namespace arbor
