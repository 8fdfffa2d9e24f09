#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "arbor/value.h"

namespace arbor {

enum class NodeKind {
  Value,
  Function,
  Lambda,
  Map,
  Filter,
  Reduce,
  Conditional,
  Program,
};

const char* node_kind_name(NodeKind kind);

// Base of every arbor failure. Carries the offending node identity (or
// kNoNode) and the operation name so errors map back to a plan position.
struct TreeError : public std::runtime_error {
  TreeError(std::string msg, NodeId node, std::string operation)
      : std::runtime_error(std::move(msg)), node_(node), operation_(std::move(operation)) {}

  NodeId node_id() const { return node_; }
  const std::string& operation() const { return operation_; }

 private:
  NodeId node_;
  std::string operation_;
};

struct StructuralError : public TreeError {
  StructuralError(std::string msg, NodeId node, std::string operation)
      : TreeError(std::move(msg), node, std::move(operation)) {}
};

// "<operation>#<id>: <detail>", the message shape shared by all errors.
std::string describe_error(const std::string& operation, NodeId node, const std::string& detail);

struct ValueNode {
  std::string name;
  Value value;
  bool placeholder = false;
};

struct FunctionNode {
  std::string name;
  std::vector<NodeId> params;
};

struct LambdaNode {
  std::vector<std::string> params;
  NodeId body = kNoNode;
};

struct MapNode {
  NodeId function = kNoNode;
  NodeId iterable = kNoNode;
};

struct FilterNode {
  NodeId function = kNoNode;
  NodeId iterable = kNoNode;
};

struct ReduceNode {
  NodeId function = kNoNode;
  NodeId iterable = kNoNode;
  NodeId initial = kNoNode;
};

struct ConditionalNode {
  NodeId predicate = kNoNode;
  NodeId consequent = kNoNode;
  NodeId alternate = kNoNode;
};

struct ProgramNode {
  std::vector<NodeId> body;
  std::string name;
  std::string description;
};

// Alternative order matches NodeKind.
using NodePayload = std::variant<ValueNode, FunctionNode, LambdaNode, MapNode, FilterNode,
                                 ReduceNode, ConditionalNode, ProgramNode>;

struct Node {
  NodeId id = kNoNode;
  std::string label;
  NodePayload payload;

  NodeKind kind() const { return static_cast<NodeKind>(payload.index()); }

  template <typename T>
  const T& as() const {
    return std::get<T>(payload);
  }

  // Operation name used in diagnostics: the function/value name, or the kind.
  std::string operation() const;
};

class Tree {
 public:
  Tree() = default;

  NodeId add_value(std::string name, Value value);
  NodeId add_placeholder(std::string name);
  NodeId add_function(std::string name, std::vector<NodeId> params);
  NodeId add_lambda(std::vector<std::string> params, NodeId body);
  NodeId add_map(NodeId function, NodeId iterable);
  NodeId add_filter(NodeId function, NodeId iterable);
  NodeId add_reduce(NodeId function, NodeId iterable, NodeId initial = kNoNode);
  NodeId add_conditional(NodeId predicate, NodeId consequent, NodeId alternate = kNoNode);
  NodeId add_program(std::vector<NodeId> body, std::string name = "", std::string description = "");

  void set_root(NodeId id);
  void set_label(NodeId id, std::string label);
  // Overwrites a Value leaf and clears its placeholder flag.
  void set_value(NodeId id, Value value);

  NodeId root() const;
  bool empty() const { return nodes_.empty(); }
  std::size_t size() const { return nodes_.size(); }
  bool contains(NodeId id) const { return id < nodes_.size(); }
  const Node& node(NodeId id) const;
  const std::vector<Node>& nodes() const { return nodes_; }

  std::vector<NodeId> children(NodeId id) const;
  std::size_t parents_count(NodeId id) const;
  // Depth-first preorder from the root; shared nodes are visited once.
  void visit(const std::function<void(const Node&)>& op) const;
  std::vector<NodeId> find_values(std::string_view name) const;
  NodeId find_label(std::string_view label) const;
  // One entry per parameter of `lambda`. A parameter that no leaf of the body
  // names binds by position to the body call's Value param at the same index;
  // kNoNode where it binds by name or has no such param.
  std::vector<NodeId> positional_parameter_leaves(NodeId lambda) const;

  std::uint64_t fingerprint() const;

 private:
  NodeId push(NodePayload payload);
  void require_child(NodeId child, const char* role, const std::string& operation) const;
  void require_lambda(NodeId fn, std::size_t arity, const std::string& operation) const;

  std::vector<Node> nodes_;
  NodeId root_ = kNoNode;
};

bool structurally_equal(const Tree& lhs, const Tree& rhs);

}  // namespace arbor
