#include <cmath>
#include <string>
#include <unordered_map>

#include "arbor/wire.h"

namespace arbor {

namespace {

std::string repr_value(const Value& value) {
  switch (value.kind) {
    case Value::Kind::String:
      return nlohmann::json(value.string_value).dump();
    case Value::Kind::Double:
      if (std::isfinite(value.double_value) && std::floor(value.double_value) == value.double_value) {
        return std::to_string(static_cast<long long>(value.double_value));
      }
      return value.to_string();
    case Value::Kind::List: {
      std::string out = "[";
      for (std::size_t i = 0; i < value.list_value.size(); ++i) {
        out += (i > 0 ? ", " : "") + repr_value(value.list_value[i]);
      }
      return out + "]";
    }
    case Value::Kind::Object: {
      std::string out = "{";
      for (std::size_t i = 0; i < value.object_value.size(); ++i) {
        out += (i > 0 ? ", " : "") + nlohmann::json(value.object_value[i].first).dump() + ": " +
               repr_value(value.object_value[i].second);
      }
      return out + "}";
    }
    default:
      return value.to_string();
  }
}

class ReprWriter {
 public:
  explicit ReprWriter(const Tree& tree) : tree_(tree) {}

  std::string entry(NodeId id) {
    const auto& node = tree_.node(id);
    switch (node.kind()) {
      case NodeKind::Value: {
        const auto& leaf = node.as<ValueNode>();
        return quote(leaf.name) + ": [" + (leaf.placeholder ? std::string() : repr_value(leaf.value)) + "]";
      }
      case NodeKind::Lambda: {
        const auto& lambda = node.as<LambdaNode>();
        std::string head = "lambda(";
        for (std::size_t i = 0; i < lambda.params.size(); ++i) {
          head += (i > 0 ? ", " : "") + lambda.params[i];
        }
        return quote(head + ")") + ": {" + entry(lambda.body) + "}";
      }
      case NodeKind::Program:
        return block(tree_.children(id));
      default:
        return quote(counted(node.operation())) + ": " + block(tree_.children(id));
    }
  }

 private:
  std::string counted(const std::string& name) { return name + "_" + std::to_string(++counts_[name]); }

  static std::string quote(const std::string& text) { return "\"" + text + "\""; }

  std::string block(const std::vector<NodeId>& ids) {
    std::string out = "{";
    for (std::size_t i = 0; i < ids.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += entry(ids[i]);
    }
    return out + "}";
  }

  const Tree& tree_;
  std::unordered_map<std::string, std::size_t> counts_;
};

}  // namespace

std::string repr(const Tree& tree) {
  if (tree.empty()) {
    return "{}";
  }
  ReprWriter writer(tree);
  const auto root = tree.root();
  if (tree.node(root).kind() == NodeKind::Program) {
    return writer.entry(root);
  }
  return "{" + writer.entry(root) + "}";
}

}  // namespace arbor
