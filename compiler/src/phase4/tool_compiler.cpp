#include <algorithm>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "arbor/tool_compiler.h"

namespace arbor {

namespace {

constexpr const char* kDefaultToolName = "compiled_tool";

BindingError binding_error(NodeId node, const std::string& operation, const std::string& detail) {
  return BindingError(describe_error(operation, node, detail), node, operation);
}

// Leaves that name a parameter of an enclosing lambda, or take one by
// position, are filled per application, never by the caller.
std::vector<bool> lambda_bound_leaves(const Tree& tree) {
  std::vector<bool> bound(tree.size(), false);
  for (const auto& node : tree.nodes()) {
    if (node.kind() != NodeKind::Lambda) {
      continue;
    }
    const auto& lambda = node.as<LambdaNode>();
    std::vector<bool> seen(tree.size(), false);
    std::vector<NodeId> stack{lambda.body};
    while (!stack.empty()) {
      const auto id = stack.back();
      stack.pop_back();
      if (seen[id]) {
        continue;
      }
      seen[id] = true;
      const auto& current = tree.node(id);
      if (current.kind() == NodeKind::Lambda) {
        continue;
      }
      if (current.kind() == NodeKind::Value) {
        const auto& name = current.as<ValueNode>().name;
        if (std::find(lambda.params.begin(), lambda.params.end(), name) != lambda.params.end()) {
          bound[id] = true;
        }
        continue;
      }
      for (const auto child : tree.children(id)) {
        stack.push_back(child);
      }
    }
    for (const auto leaf : tree.positional_parameter_leaves(node.id)) {
      if (leaf != kNoNode) {
        bound[leaf] = true;
      }
    }
  }
  return bound;
}

}  // namespace

CompiledTool::CompiledTool(std::shared_ptr<const Tree> tree, std::vector<std::string> params,
                           std::unordered_map<std::string, std::vector<NodeId>> bindings, Evaluator evaluator)
    : tree_(std::move(tree)),
      params_(std::move(params)),
      bindings_(std::move(bindings)),
      evaluator_(std::move(evaluator)),
      name_(kDefaultToolName) {
  const auto& root = tree_->node(tree_->root());
  if (root.kind() == NodeKind::Program) {
    const auto& program = root.as<ProgramNode>();
    if (!program.name.empty()) {
      name_ = program.name;
    }
    description_ = program.description;
  }
}

const std::vector<NodeId>& CompiledTool::bindings(const std::string& param) const {
  const auto it = bindings_.find(param);
  if (it == bindings_.end()) {
    throw binding_error(kNoNode, name_, "unknown parameter '" + param + "'");
  }
  return it->second;
}

ToolDefinition CompiledTool::definition() const {
  ToolDefinition out;
  out.name = name_;
  out.description = description_;
  for (const auto& param : params_) {
    out.parameters.push_back(ToolParameter{param, "any", ""});
  }
  return out;
}

std::shared_ptr<Tree> CompiledTool::bind(const ToolArguments& args) const {
  for (const auto& entry : args) {
    if (bindings_.find(entry.first) == bindings_.end()) {
      throw binding_error(kNoNode, name_, "unexpected argument '" + entry.first + "'");
    }
  }
  auto working = std::make_shared<Tree>(*tree_);
  for (const auto& param : params_) {
    const auto it = args.find(param);
    if (it == args.end()) {
      throw binding_error(kNoNode, name_, "missing argument '" + param + "'");
    }
    for (const auto leaf : bindings_.at(param)) {
      working->set_value(leaf, it->second);
    }
  }
  return working;
}

Value CompiledTool::invoke(const ToolArguments& args, const CancelToken& cancel) const {
  std::shared_ptr<const Tree> working = bind(args);
  return evaluator_.evaluate(std::move(working), cancel);
}

Value CompiledTool::call_positional(const std::vector<Value>& args) const {
  if (args.size() != params_.size()) {
    throw binding_error(kNoNode, name_, "expects " + std::to_string(params_.size()) + " argument(s), got " +
                                            std::to_string(args.size()));
  }
  ToolArguments named;
  for (std::size_t i = 0; i < args.size(); ++i) {
    named.emplace(params_[i], args[i]);
  }
  return invoke(named);
}

ToolCompiler::ToolCompiler(std::shared_ptr<ToolProvider> provider, EvalOptions options)
    : provider_(std::move(provider)), options_(std::move(options)) {}

CompiledTool ToolCompiler::compile(const Tree& tree, const std::vector<std::string>& declared_params,
                                   const BindingOverrides& overrides) const {
  if (tree.empty()) {
    throw binding_error(kNoNode, "compile", "tree is empty");
  }

  std::unordered_set<std::string> declared;
  for (const auto& param : declared_params) {
    if (param.empty()) {
      throw binding_error(kNoNode, "compile", "parameter name must not be empty");
    }
    if (!declared.insert(param).second) {
      throw binding_error(kNoNode, "compile", "duplicate parameter '" + param + "'");
    }
  }

  for (const auto& entry : overrides) {
    if (!tree.contains(entry.first) || tree.node(entry.first).kind() != NodeKind::Value) {
      throw binding_error(entry.first, "compile", "override target is not a value leaf");
    }
    if (declared.count(entry.second) == 0) {
      throw binding_error(entry.first, "compile", "override names undeclared parameter '" + entry.second + "'");
    }
  }

  const auto lambda_bound = lambda_bound_leaves(tree);
  std::unordered_map<std::string, std::vector<NodeId>> bindings;
  for (const auto& param : declared_params) {
    bindings[param];
  }
  std::unordered_set<NodeId> bound_leaves;
  tree.visit([&](const Node& node) {
    if (node.kind() != NodeKind::Value || lambda_bound[node.id]) {
      return;
    }
    std::string param;
    if (const auto it = overrides.find(node.id); it != overrides.end()) {
      param = it->second;
    } else if (declared.count(node.as<ValueNode>().name) > 0) {
      param = node.as<ValueNode>().name;
    } else {
      return;
    }
    bindings[param].push_back(node.id);
    bound_leaves.insert(node.id);
  });

  for (const auto& param : declared_params) {
    if (bindings[param].empty()) {
      throw binding_error(kNoNode, "compile", "parameter '" + param + "' matches no value leaf");
    }
  }

  tree.visit([&](const Node& node) {
    if (node.kind() == NodeKind::Value && node.as<ValueNode>().placeholder && !lambda_bound[node.id] &&
        bound_leaves.count(node.id) == 0) {
      throw binding_error(node.id, node.operation(),
                          "placeholder '" + node.as<ValueNode>().name + "' is not bound to any parameter");
    }
  });

  return CompiledTool(std::make_shared<const Tree>(tree), declared_params, std::move(bindings),
                      Evaluator(provider_, options_));
}

CompiledTool ToolCompiler::compile(const Tree& tree) const {
  if (tree.empty()) {
    throw binding_error(kNoNode, "compile", "tree is empty");
  }
  const auto lambda_bound = lambda_bound_leaves(tree);
  std::vector<std::string> params;
  std::unordered_set<std::string> seen;
  tree.visit([&](const Node& node) {
    if (node.kind() != NodeKind::Value || lambda_bound[node.id] || !node.as<ValueNode>().placeholder) {
      return;
    }
    if (seen.insert(node.as<ValueNode>().name).second) {
      params.push_back(node.as<ValueNode>().name);
    }
  });
  return compile(tree, params);
}

void register_compiled_tool(LocalToolRegistry& registry, const CompiledTool& tool) {
  registry.register_tool(tool.definition(),
                         [tool](const std::vector<Value>& args) { return tool.call_positional(args); });
}

}  // namespace arbor
