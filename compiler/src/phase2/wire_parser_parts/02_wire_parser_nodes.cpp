namespace {

class WireTreeBuilder {
 public:
  WireTreeBuilder(const arbor::ParseOptions& options, arbor::Tree& tree) : options_(options), tree_(tree) {}

  void index(const json& wire, const std::string& path) { index_wire_ids(wire, path, 0, options_.max_depth, ids_); }

  arbor::NodeId build(const json& node, const std::string& path, std::size_t depth, bool call_shorthand = false) {
    if (depth > options_.max_depth) {
      throw parse_error(path, wire_operation(node),
                        "nesting exceeds max depth " + std::to_string(options_.max_depth));
    }
    if (!node.is_object()) {
      throw parse_error(path, "node", "expected a node object");
    }
    if (const auto it = node.find("ref"); it != node.end()) {
      if (!it->is_string()) {
        throw parse_error(child_path(path, "ref"), "ref", "field 'ref' must be a string");
      }
      return resolve_ref(it->get<std::string>(), path, depth);
    }

    const auto label = node.contains("id") ? node.at("id").get<std::string>() : std::string();
    if (!label.empty()) {
      if (const auto it = built_.find(label); it != built_.end()) {
        return it->second;
      }
      open_.insert(label);
    }

    const auto id = call_shorthand ? build_call(node, path, depth) : build_typed(node, path, depth);

    if (!label.empty()) {
      open_.erase(label);
      tree_.set_label(id, label);
      built_.emplace(label, id);
    }
    return id;
  }

 private:
  arbor::NodeId resolve_ref(const std::string& target, const std::string& path, std::size_t depth) {
    if (const auto it = built_.find(target); it != built_.end()) {
      return it->second;
    }
    if (open_.count(target) > 0) {
      throw parse_error(path, target, "cyclic reference to '" + target + "'");
    }
    const auto entry = ids_.find(target);
    if (entry == ids_.end()) {
      throw parse_error(path, target, "unresolved ref '" + target + "'");
    }
    // The target sits at the referencing position; the hop itself adds no level.
    return build(*entry->second.node, entry->second.path, depth, entry->second.call_shorthand);
  }

  arbor::NodeId build_typed(const json& node, const std::string& path, std::size_t depth) {
    const auto type = require_string(node, "type", path);
    if (type == "value") {
      return build_value(node, path);
    }
    if (type == "function") {
      return build_function(node, path, depth);
    }
    if (type == "lambda") {
      return build_lambda(node, path, depth);
    }
    if (type == "map" || type == "filter") {
      return build_map_like(type, node, path, depth);
    }
    if (type == "reduce") {
      return build_reduce(node, path, depth);
    }
    if (type == "conditional") {
      return build_conditional(node, path, depth);
    }
    if (type == "program") {
      return build_program(node, path, depth);
    }
    throw parse_error(child_path(path, "type"), wire_operation(node), "unknown node type '" + type + "'");
  }

  arbor::NodeId build_value(const json& node, const std::string& path) {
    auto name = require_string(node, "name", path);
    if (name.empty()) {
      throw parse_error(child_path(path, "name"), "value", "field 'name' must not be empty");
    }
    const auto it = node.find("value");
    if (it == node.end()) {
      return tree_.add_placeholder(std::move(name));
    }
    return tree_.add_value(std::move(name), arbor::value_from_json(*it));
  }

  std::vector<arbor::NodeId> build_list(const json& node, std::initializer_list<const char*> keys,
                                        const std::string& path, std::size_t depth, bool required) {
    const auto* field = find_field(node, keys);
    if (!field) {
      if (required) {
        throw parse_error(path, wire_operation(node), std::string("missing required field '") + *keys.begin() + "'");
      }
      return {};
    }
    const std::string key = node.contains(*keys.begin()) ? *keys.begin() : *(keys.begin() + 1);
    if (!field->is_array()) {
      throw parse_error(child_path(path, key), wire_operation(node), "field '" + key + "' must be an array");
    }
    std::vector<arbor::NodeId> out;
    out.reserve(field->size());
    for (std::size_t i = 0; i < field->size(); ++i) {
      out.push_back(build((*field)[i], child_path(child_path(path, key), i), depth + 1));
    }
    return out;
  }

  arbor::NodeId build_call(const json& node, const std::string& path, std::size_t depth) {
    auto name = require_string(node, "name", path);
    if (name.empty()) {
      throw parse_error(child_path(path, "name"), "function", "field 'name' must not be empty");
    }
    auto params = build_list(node, {"params", "arguments"}, path, depth, false);
    if (!options_.tool_arity.empty()) {
      const auto it = options_.tool_arity.find(name);
      if (it == options_.tool_arity.end()) {
        if (options_.strict_tools) {
          throw parse_error(path, name, "unknown tool '" + name + "'");
        }
      } else if (it->second != params.size()) {
        throw parse_error(path, name, "tool '" + name + "' expects " + std::to_string(it->second) +
                                          " param(s), got " + std::to_string(params.size()));
      }
    }
    return tree_.add_function(std::move(name), std::move(params));
  }

  arbor::NodeId build_function(const json& node, const std::string& path, std::size_t depth) {
    return build_call(node, path, depth);
  }

  arbor::NodeId build_lambda(const json& node, const std::string& path, std::size_t depth) {
    const auto& raw_params = require_field(node, {"params"}, path);
    if (!raw_params.is_array()) {
      throw parse_error(child_path(path, "params"), wire_operation(node), "field 'params' must be an array");
    }
    std::vector<std::string> params;
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < raw_params.size(); ++i) {
      const auto& param = raw_params[i];
      const auto where = child_path(child_path(path, "params"), i);
      if (!param.is_string() || param.get<std::string>().empty()) {
        throw parse_error(where, "lambda", "lambda parameter must be a non-empty string");
      }
      if (!seen.insert(param.get<std::string>()).second) {
        throw parse_error(where, "lambda", "duplicate lambda parameter '" + param.get<std::string>() + "'");
      }
      params.push_back(param.get<std::string>());
    }

    const auto& body = require_field(node, {"body"}, path);
    const auto body_path = child_path(path, "body");
    // Function-body shorthand: {"name": ..., "params": [...]}.
    const bool shorthand = body.is_object() && !body.contains("type") && !body.contains("ref");
    const auto body_id = build(body, body_path, depth + 1, shorthand);
    return tree_.add_lambda(std::move(params), body_id);
  }

  arbor::NodeId build_lambda_child(const json& node, std::size_t arity, const std::string& operation,
                                   const std::string& path, std::size_t depth) {
    const auto& raw = require_field(node, {"function"}, path);
    const auto fn_path = child_path(path, "function");
    const auto fn = build(raw, fn_path, depth + 1);
    const auto& built = tree_.node(fn);
    if (built.kind() != arbor::NodeKind::Lambda) {
      throw parse_error(fn_path, operation, std::string("function must be a lambda, got ") +
                                                arbor::node_kind_name(built.kind()));
    }
    const auto params = built.as<arbor::LambdaNode>().params.size();
    if (params != arity) {
      throw parse_error(fn_path, operation, operation + " lambda must take " + std::to_string(arity) +
                                                " parameter(s), takes " + std::to_string(params));
    }
    return fn;
  }

  arbor::NodeId build_map_like(const std::string& type, const json& node, const std::string& path,
                               std::size_t depth) {
    const auto fn = build_lambda_child(node, 1, type, path, depth);
    const auto iterable = build(require_field(node, {"iterable"}, path), child_path(path, "iterable"), depth + 1);
    return type == "map" ? tree_.add_map(fn, iterable) : tree_.add_filter(fn, iterable);
  }

  arbor::NodeId build_reduce(const json& node, const std::string& path, std::size_t depth) {
    const auto fn = build_lambda_child(node, 2, "reduce", path, depth);
    const auto iterable = build(require_field(node, {"iterable"}, path), child_path(path, "iterable"), depth + 1);
    auto initial = arbor::kNoNode;
    if (const auto it = node.find("initial"); it != node.end() && !it->is_null()) {
      initial = build(*it, child_path(path, "initial"), depth + 1);
    }
    return tree_.add_reduce(fn, iterable, initial);
  }

  arbor::NodeId build_conditional(const json& node, const std::string& path, std::size_t depth) {
    const auto& condition = require_field(node, {"condition", "predicate"}, path);
    const auto predicate = build(condition, child_path(path, "condition"), depth + 1);
    const auto& then_branch = require_field(node, {"true_branch", "consequent", "then"}, path);
    const auto consequent = build(then_branch, child_path(path, "true_branch"), depth + 1);
    auto alternate = arbor::kNoNode;
    if (const auto* else_branch = find_field(node, {"false_branch", "alternate", "else"});
        else_branch && !else_branch->is_null()) {
      alternate = build(*else_branch, child_path(path, "false_branch"), depth + 1);
    }
    return tree_.add_conditional(predicate, consequent, alternate);
  }

  arbor::NodeId build_program(const json& node, const std::string& path, std::size_t depth) {
    auto body = build_list(node, {"body"}, path, depth, false);
    return tree_.add_program(std::move(body), optional_string(node, "name", path),
                             optional_string(node, "description", path));
  }

  const arbor::ParseOptions& options_;
  arbor::Tree& tree_;
  std::unordered_map<std::string, WireIdEntry> ids_;
  std::unordered_map<std::string, arbor::NodeId> built_;
  std::unordered_set<std::string> open_;
};

}  // namespace
