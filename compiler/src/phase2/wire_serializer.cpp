#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "arbor/wire.h"

namespace arbor {

namespace {

using ordered_json = nlohmann::ordered_json;

class WireEmitter {
 public:
  WireEmitter(const Tree& tree, const SerializeOptions& options) : tree_(tree), options_(options) {
    tree_.visit([this](const Node& node) {
      for (const auto child : tree_.children(node.id)) {
        ++references_[child];
      }
      if (!node.label.empty()) {
        taken_.insert(node.label);
      }
    });
  }

  ordered_json emit(NodeId id) {
    if (const auto it = assigned_.find(id); it != assigned_.end() && emitted_.count(id) > 0) {
      ordered_json ref = ordered_json::object();
      ref["ref"] = it->second;
      return ref;
    }
    emitted_.insert(id);

    const auto& node = tree_.node(id);
    ordered_json out = ordered_json::object();
    out["type"] = node_kind_name(node.kind());
    if (needs_id(id)) {
      out["id"] = assign_id(node);
    }

    switch (node.kind()) {
      case NodeKind::Value: {
        const auto& leaf = node.as<ValueNode>();
        out["name"] = leaf.name;
        if (!leaf.placeholder) {
          out["value"] = ordered_json(value_to_json(leaf.value));
        }
        break;
      }
      case NodeKind::Function: {
        const auto& call = node.as<FunctionNode>();
        out["name"] = call.name;
        out["params"] = emit_list(call.params);
        break;
      }
      case NodeKind::Lambda: {
        const auto& lambda = node.as<LambdaNode>();
        out["params"] = lambda.params;
        out["body"] = emit(lambda.body);
        break;
      }
      case NodeKind::Map: {
        const auto& map = node.as<MapNode>();
        out["function"] = emit(map.function);
        out["iterable"] = emit(map.iterable);
        break;
      }
      case NodeKind::Filter: {
        const auto& filter = node.as<FilterNode>();
        out["function"] = emit(filter.function);
        out["iterable"] = emit(filter.iterable);
        break;
      }
      case NodeKind::Reduce: {
        const auto& reduce = node.as<ReduceNode>();
        out["function"] = emit(reduce.function);
        out["iterable"] = emit(reduce.iterable);
        if (reduce.initial != kNoNode) {
          out["initial"] = emit(reduce.initial);
        }
        break;
      }
      case NodeKind::Conditional: {
        const auto& branch = node.as<ConditionalNode>();
        out["condition"] = emit(branch.predicate);
        out["true_branch"] = emit(branch.consequent);
        if (branch.alternate != kNoNode) {
          out["false_branch"] = emit(branch.alternate);
        }
        break;
      }
      case NodeKind::Program: {
        const auto& program = node.as<ProgramNode>();
        if (!program.name.empty()) {
          out["name"] = program.name;
        }
        if (!program.description.empty()) {
          out["description"] = program.description;
        }
        out["body"] = emit_list(program.body);
        break;
      }
    }
    return out;
  }

 private:
  bool needs_id(NodeId id) const {
    if (options_.emit_ids) {
      return true;
    }
    const auto it = references_.find(id);
    return it != references_.end() && it->second > 1;
  }

  // Keeps the node's own label; otherwise `<operation>_<n>`, skipping taken ids.
  const std::string& assign_id(const Node& node) {
    if (!node.label.empty()) {
      return assigned_.emplace(node.id, node.label).first->second;
    }
    const auto base = node.operation();
    auto& counter = counters_[base];
    std::string candidate;
    do {
      candidate = base + "_" + std::to_string(++counter);
    } while (taken_.count(candidate) > 0);
    taken_.insert(candidate);
    return assigned_.emplace(node.id, std::move(candidate)).first->second;
  }

  ordered_json emit_list(const std::vector<NodeId>& ids) {
    ordered_json out = ordered_json::array();
    for (const auto id : ids) {
      out.push_back(emit(id));
    }
    return out;
  }

  const Tree& tree_;
  const SerializeOptions& options_;
  std::unordered_map<NodeId, std::size_t> references_;
  std::unordered_map<NodeId, std::string> assigned_;
  std::unordered_map<std::string, std::size_t> counters_;
  std::unordered_set<std::string> taken_;
  std::unordered_set<NodeId> emitted_;
};

}  // namespace

WireSerializer::WireSerializer(SerializeOptions options) : options_(options) {}

nlohmann::ordered_json WireSerializer::serialize(const Tree& tree) const {
  if (tree.empty()) {
    throw StructuralError(describe_error("serialize", kNoNode, "tree is empty"), kNoNode, "serialize");
  }
  WireEmitter emitter(tree, options_);
  auto ast = emitter.emit(tree.root());
  if (!options_.envelope) {
    return ast;
  }
  nlohmann::ordered_json envelope = nlohmann::ordered_json::object();
  envelope["schema_version"] = kCurrentSchemaVersion;
  envelope["ast"] = std::move(ast);
  return envelope;
}

std::string WireSerializer::serialize_text(const Tree& tree, int indent) const {
  return serialize(tree).dump(indent);
}

}  // namespace arbor
