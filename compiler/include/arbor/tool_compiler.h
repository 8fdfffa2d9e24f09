#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "arbor/evaluator.h"
#include "arbor/tool_provider.h"
#include "arbor/tree.h"

namespace arbor {

struct BindingError : public TreeError {
  BindingError(std::string msg, NodeId node, std::string operation)
      : TreeError(std::move(msg), node, std::move(operation)) {}
};

// Leaf identity -> declared parameter that feeds it.
using BindingOverrides = std::unordered_map<NodeId, std::string>;
using ToolArguments = std::unordered_map<std::string, Value>;

class CompiledTool {
 public:
  const std::string& name() const { return name_; }
  const std::string& description() const { return description_; }
  const std::vector<std::string>& params() const { return params_; }
  const std::vector<NodeId>& bindings(const std::string& param) const;
  const Tree& tree() const { return *tree_; }

  ToolDefinition definition() const;

  Value operator()(const ToolArguments& args) const { return invoke(args); }
  Value invoke(const ToolArguments& args, const CancelToken& cancel = CancelToken()) const;
  Value call_positional(const std::vector<Value>& args) const;

 private:
  friend class ToolCompiler;

  CompiledTool(std::shared_ptr<const Tree> tree, std::vector<std::string> params,
               std::unordered_map<std::string, std::vector<NodeId>> bindings, Evaluator evaluator);

  std::shared_ptr<Tree> bind(const ToolArguments& args) const;

  std::shared_ptr<const Tree> tree_;
  std::vector<std::string> params_;
  std::unordered_map<std::string, std::vector<NodeId>> bindings_;
  Evaluator evaluator_;
  std::string name_;
  std::string description_;
};

class ToolCompiler {
 public:
  explicit ToolCompiler(std::shared_ptr<ToolProvider> provider,
                        EvalOptions options = EvalOptions::from_env());

  CompiledTool compile(const Tree& tree, const std::vector<std::string>& declared_params,
                       const BindingOverrides& overrides = {}) const;
  // Declared parameters inferred from placeholder leaves, first occurrence order.
  CompiledTool compile(const Tree& tree) const;

 private:
  std::shared_ptr<ToolProvider> provider_;
  EvalOptions options_;
};

void register_compiled_tool(LocalToolRegistry& registry, const CompiledTool& tool);

}  // namespace arbor
