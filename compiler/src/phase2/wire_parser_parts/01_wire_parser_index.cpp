namespace {

struct WireIdEntry {
  const json* node = nullptr;
  std::string path;
  // Lambda body written as {"name", "params"} without a "type".
  bool call_shorthand = false;
};

bool is_call_shorthand_body(const json& lambda, const std::string& key, const json& body) {
  if (key != "body" || !body.is_object() || body.contains("type") || body.contains("ref")) {
    return false;
  }
  const auto type = lambda.find("type");
  return type != lambda.end() && type->is_string() && type->get<std::string>() == "lambda";
}

// Collects every `"id"`-carrying object so refs can point forward.
void index_wire_ids(const json& node, const std::string& path, std::size_t depth, std::size_t max_depth,
                    std::unordered_map<std::string, WireIdEntry>& out, bool call_shorthand = false) {
  // Each tree level costs two JSON levels (node object + child array).
  if (depth > 2 * max_depth + 2) {
    throw parse_error(path, wire_operation(node), "nesting exceeds max depth " + std::to_string(max_depth));
  }
  if (node.is_array()) {
    for (std::size_t i = 0; i < node.size(); ++i) {
      index_wire_ids(node[i], child_path(path, i), depth + 1, max_depth, out);
    }
    return;
  }
  if (!node.is_object()) {
    return;
  }
  if (const auto it = node.find("id"); it != node.end()) {
    if (!it->is_string() || it->get<std::string>().empty()) {
      throw parse_error(child_path(path, "id"), "node", "field 'id' must be a non-empty string");
    }
    const auto id = it->get<std::string>();
    const auto [existing, inserted] = out.emplace(id, WireIdEntry{&node, path, call_shorthand});
    if (!inserted) {
      throw parse_error(path, id, "duplicate id '" + id + "' (first defined at " +
                                      (existing->second.path.empty() ? "/" : existing->second.path) + ")");
    }
  }
  for (auto it = node.begin(); it != node.end(); ++it) {
    if (it.key() == "value") {
      // Literal payloads are data, not nodes.
      continue;
    }
    if (it->is_object() || it->is_array()) {
      index_wire_ids(*it, child_path(path, it.key()), depth + 1, max_depth, out,
                     is_call_shorthand_body(node, it.key(), *it));
    }
  }
}

}  // namespace
