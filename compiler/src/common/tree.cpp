#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "arbor/tree.h"

namespace arbor {

namespace {

struct CanonicalWriter {
  const Tree& tree;
  std::unordered_map<NodeId, std::size_t> ordinals;
  std::string out;

  void write(NodeId id) {
    if (const auto it = ordinals.find(id); it != ordinals.end()) {
      out += "@" + std::to_string(it->second);
      return;
    }
    ordinals.emplace(id, ordinals.size());
    const auto& node = tree.node(id);
    out += "(";
    out += node_kind_name(node.kind());
    switch (node.kind()) {
      case NodeKind::Value: {
        const auto& leaf = node.as<ValueNode>();
        out += " " + leaf.name;
        out += leaf.placeholder ? " ?" : " " + value_to_json(leaf.value).dump();
        break;
      }
      case NodeKind::Function:
        out += " " + node.as<FunctionNode>().name;
        break;
      case NodeKind::Lambda:
        for (const auto& param : node.as<LambdaNode>().params) {
          out += " %" + param;
        }
        break;
      case NodeKind::Reduce:
        out += node.as<ReduceNode>().initial == kNoNode ? " -" : " +";
        break;
      case NodeKind::Conditional:
        out += node.as<ConditionalNode>().alternate == kNoNode ? " -" : " +";
        break;
      case NodeKind::Program: {
        const auto& program = node.as<ProgramNode>();
        out += " " + nlohmann::json(program.name).dump() + " " + nlohmann::json(program.description).dump();
        break;
      }
      case NodeKind::Map:
      case NodeKind::Filter:
        break;
    }
    for (const auto child : tree.children(id)) {
      out += " ";
      write(child);
    }
    out += ")";
  }
};

std::string canonical_form(const Tree& tree) {
  if (tree.empty()) {
    return "()";
  }
  CanonicalWriter writer{tree, {}, {}};
  writer.write(tree.root());
  return writer.out;
}

}  // namespace

const char* node_kind_name(NodeKind kind) {
  switch (kind) {
    case NodeKind::Value:
      return "value";
    case NodeKind::Function:
      return "function";
    case NodeKind::Lambda:
      return "lambda";
    case NodeKind::Map:
      return "map";
    case NodeKind::Filter:
      return "filter";
    case NodeKind::Reduce:
      return "reduce";
    case NodeKind::Conditional:
      return "conditional";
    case NodeKind::Program:
      return "program";
  }
  return "value";
}

std::string describe_error(const std::string& operation, NodeId node, const std::string& detail) {
  if (node == kNoNode) {
    return operation + ": " + detail;
  }
  return operation + "#" + std::to_string(node) + ": " + detail;
}

std::string Node::operation() const {
  switch (kind()) {
    case NodeKind::Value:
      return as<ValueNode>().name;
    case NodeKind::Function:
      return as<FunctionNode>().name;
    default:
      return node_kind_name(kind());
  }
}

NodeId Tree::push(NodePayload payload) {
  Node node;
  node.id = static_cast<NodeId>(nodes_.size());
  node.payload = std::move(payload);
  nodes_.push_back(std::move(node));
  return nodes_.back().id;
}

void Tree::require_child(NodeId child, const char* role, const std::string& operation) const {
  if (!contains(child)) {
    throw StructuralError(describe_error(operation, static_cast<NodeId>(nodes_.size()),
                                         std::string(role) + " references undefined node"),
                          static_cast<NodeId>(nodes_.size()), operation);
  }
}

void Tree::require_lambda(NodeId fn, std::size_t arity, const std::string& operation) const {
  require_child(fn, "function", operation);
  const auto& node = nodes_[fn];
  const auto next = static_cast<NodeId>(nodes_.size());
  if (node.kind() != NodeKind::Lambda) {
    throw StructuralError(describe_error(operation, next, "function must be a lambda, got " +
                                                               std::string(node_kind_name(node.kind()))),
                          next, operation);
  }
  const auto params = node.as<LambdaNode>().params.size();
  if (params != arity) {
    throw StructuralError(describe_error(operation, next, "lambda must take " + std::to_string(arity) +
                                                               " parameter(s), takes " + std::to_string(params)),
                          next, operation);
  }
}

NodeId Tree::add_value(std::string name, Value value) {
  if (name.empty()) {
    throw StructuralError(describe_error("value", static_cast<NodeId>(nodes_.size()), "name must not be empty"),
                          static_cast<NodeId>(nodes_.size()), "value");
  }
  return push(ValueNode{std::move(name), std::move(value), false});
}

NodeId Tree::add_placeholder(std::string name) {
  const auto id = add_value(std::move(name), Value::nil());
  std::get<ValueNode>(nodes_[id].payload).placeholder = true;
  return id;
}

NodeId Tree::add_function(std::string name, std::vector<NodeId> params) {
  if (name.empty()) {
    throw StructuralError(describe_error("function", static_cast<NodeId>(nodes_.size()), "name must not be empty"),
                          static_cast<NodeId>(nodes_.size()), "function");
  }
  for (const auto param : params) {
    require_child(param, "param", name);
  }
  return push(FunctionNode{std::move(name), std::move(params)});
}

NodeId Tree::add_lambda(std::vector<std::string> params, NodeId body) {
  const auto next = static_cast<NodeId>(nodes_.size());
  std::unordered_set<std::string> seen;
  for (const auto& param : params) {
    if (param.empty()) {
      throw StructuralError(describe_error("lambda", next, "parameter name must not be empty"), next, "lambda");
    }
    if (!seen.insert(param).second) {
      throw StructuralError(describe_error("lambda", next, "duplicate parameter '" + param + "'"), next, "lambda");
    }
  }
  require_child(body, "body", "lambda");
  return push(LambdaNode{std::move(params), body});
}

NodeId Tree::add_map(NodeId function, NodeId iterable) {
  require_lambda(function, 1, "map");
  require_child(iterable, "iterable", "map");
  return push(MapNode{function, iterable});
}

NodeId Tree::add_filter(NodeId function, NodeId iterable) {
  require_lambda(function, 1, "filter");
  require_child(iterable, "iterable", "filter");
  return push(FilterNode{function, iterable});
}

NodeId Tree::add_reduce(NodeId function, NodeId iterable, NodeId initial) {
  require_lambda(function, 2, "reduce");
  require_child(iterable, "iterable", "reduce");
  if (initial != kNoNode) {
    require_child(initial, "initial", "reduce");
  }
  return push(ReduceNode{function, iterable, initial});
}

NodeId Tree::add_conditional(NodeId predicate, NodeId consequent, NodeId alternate) {
  require_child(predicate, "condition", "conditional");
  require_child(consequent, "true_branch", "conditional");
  if (alternate != kNoNode) {
    require_child(alternate, "false_branch", "conditional");
  }
  return push(ConditionalNode{predicate, consequent, alternate});
}

NodeId Tree::add_program(std::vector<NodeId> body, std::string name, std::string description) {
  for (const auto statement : body) {
    require_child(statement, "statement", "program");
  }
  return push(ProgramNode{std::move(body), std::move(name), std::move(description)});
}

void Tree::set_root(NodeId id) {
  if (!contains(id)) {
    throw StructuralError(describe_error("set_root", id, "node does not exist"), id, "set_root");
  }
  root_ = id;
}

void Tree::set_label(NodeId id, std::string label) {
  if (!contains(id)) {
    throw StructuralError(describe_error("set_label", id, "node does not exist"), id, "set_label");
  }
  if (!label.empty()) {
    const auto owner = find_label(label);
    if (owner != kNoNode && owner != id) {
      throw StructuralError(describe_error(nodes_[id].operation(), id, "label '" + label + "' already used by node " +
                                                                          std::to_string(owner)),
                            id, nodes_[id].operation());
    }
  }
  nodes_[id].label = std::move(label);
}

void Tree::set_value(NodeId id, Value value) {
  if (!contains(id) || nodes_[id].kind() != NodeKind::Value) {
    throw StructuralError(describe_error("set_value", id, "node is not a value leaf"), id, "set_value");
  }
  auto& leaf = std::get<ValueNode>(nodes_[id].payload);
  leaf.value = std::move(value);
  leaf.placeholder = false;
}

NodeId Tree::root() const {
  if (root_ != kNoNode) {
    return root_;
  }
  return nodes_.empty() ? kNoNode : static_cast<NodeId>(nodes_.size() - 1);
}

const Node& Tree::node(NodeId id) const {
  if (!contains(id)) {
    throw StructuralError(describe_error("node", id, "node does not exist"), id, "node");
  }
  return nodes_[id];
}

std::vector<NodeId> Tree::children(NodeId id) const {
  const auto& target = node(id);
  switch (target.kind()) {
    case NodeKind::Value:
      return {};
    case NodeKind::Function:
      return target.as<FunctionNode>().params;
    case NodeKind::Lambda:
      return {target.as<LambdaNode>().body};
    case NodeKind::Map: {
      const auto& map = target.as<MapNode>();
      return {map.function, map.iterable};
    }
    case NodeKind::Filter: {
      const auto& filter = target.as<FilterNode>();
      return {filter.function, filter.iterable};
    }
    case NodeKind::Reduce: {
      const auto& reduce = target.as<ReduceNode>();
      std::vector<NodeId> out{reduce.function, reduce.iterable};
      if (reduce.initial != kNoNode) {
        out.push_back(reduce.initial);
      }
      return out;
    }
    case NodeKind::Conditional: {
      const auto& branch = target.as<ConditionalNode>();
      std::vector<NodeId> out{branch.predicate, branch.consequent};
      if (branch.alternate != kNoNode) {
        out.push_back(branch.alternate);
      }
      return out;
    }
    case NodeKind::Program:
      return target.as<ProgramNode>().body;
  }
  return {};
}

std::size_t Tree::parents_count(NodeId id) const {
  std::size_t count = 0;
  visit([&](const Node& node) {
    for (const auto child : children(node.id)) {
      if (child == id) {
        ++count;
      }
    }
  });
  return count;
}

void Tree::visit(const std::function<void(const Node&)>& op) const {
  if (nodes_.empty()) {
    return;
  }
  std::vector<bool> seen(nodes_.size(), false);
  std::vector<NodeId> stack{root()};
  while (!stack.empty()) {
    const auto id = stack.back();
    stack.pop_back();
    if (seen[id]) {
      continue;
    }
    seen[id] = true;
    op(nodes_[id]);
    const auto kids = children(id);
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      if (!seen[*it]) {
        stack.push_back(*it);
      }
    }
  }
}

std::vector<NodeId> Tree::find_values(std::string_view name) const {
  std::vector<NodeId> out;
  visit([&](const Node& node) {
    if (node.kind() == NodeKind::Value && node.as<ValueNode>().name == name) {
      out.push_back(node.id);
    }
  });
  return out;
}

NodeId Tree::find_label(std::string_view label) const {
  for (const auto& node : nodes_) {
    if (!node.label.empty() && node.label == label) {
      return node.id;
    }
  }
  return kNoNode;
}

std::vector<NodeId> Tree::positional_parameter_leaves(NodeId lambda) const {
  const auto& fn = node(lambda).as<LambdaNode>();
  std::vector<NodeId> out(fn.params.size(), kNoNode);
  const auto& body = node(fn.body);
  if (body.kind() != NodeKind::Function) {
    return out;
  }

  // Leaf names in the lambda's own scope; nested lambdas bind their own.
  std::unordered_set<std::string> named;
  std::vector<bool> seen(nodes_.size(), false);
  std::vector<NodeId> stack{fn.body};
  while (!stack.empty()) {
    const auto id = stack.back();
    stack.pop_back();
    if (seen[id]) {
      continue;
    }
    seen[id] = true;
    const auto& current = node(id);
    if (current.kind() == NodeKind::Lambda) {
      continue;
    }
    if (current.kind() == NodeKind::Value) {
      named.insert(current.as<ValueNode>().name);
      continue;
    }
    for (const auto child : children(id)) {
      stack.push_back(child);
    }
  }

  const auto& args = body.as<FunctionNode>().params;
  for (std::size_t i = 0; i < fn.params.size() && i < args.size(); ++i) {
    const auto& leaf = node(args[i]);
    if (named.count(fn.params[i]) > 0 || leaf.kind() != NodeKind::Value) {
      continue;
    }
    const auto& leaf_name = leaf.as<ValueNode>().name;
    if (std::find(fn.params.begin(), fn.params.end(), leaf_name) != fn.params.end() ||
        std::find(out.begin(), out.end(), args[i]) != out.end()) {
      continue;
    }
    out[i] = args[i];
  }
  return out;
}

std::uint64_t Tree::fingerprint() const {
  // FNV-1a over the canonical form.
  std::uint64_t hash = 1469598103934665603ull;
  for (const unsigned char ch : canonical_form(*this)) {
    hash ^= ch;
    hash *= 1099511628211ull;
  }
  return hash;
}

bool structurally_equal(const Tree& lhs, const Tree& rhs) { return canonical_form(lhs) == canonical_form(rhs); }

}  // namespace arbor
