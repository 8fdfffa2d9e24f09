namespace arbor {

WireParser::WireParser(ParseOptions options) : options_(std::move(options)) {}

Tree WireParser::parse(const nlohmann::json& wire) const {
  Tree tree;
  WireTreeBuilder builder(options_, tree);

  const json* ast = &wire;
  std::string ast_path;
  if (wire.is_object() && (wire.contains("schema_version") || wire.contains("ast"))) {
    if (const auto it = wire.find("schema_version"); it != wire.end()) {
      if (!it->is_string() || it->get<std::string>() != kCurrentSchemaVersion) {
        throw parse_error("/schema_version", "envelope",
                          "unsupported schema_version " + it->dump() + " (expected " + kCurrentSchemaVersion + ")");
      }
    }
    ast = &require_field(wire, {"ast"}, "");
    ast_path = "/ast";
  }

  try {
    builder.index(*ast, ast_path);
    NodeId root = kNoNode;
    if (ast->is_array()) {
      // A bare statement list is an implicit program.
      std::vector<NodeId> body;
      body.reserve(ast->size());
      for (std::size_t i = 0; i < ast->size(); ++i) {
        body.push_back(builder.build((*ast)[i], child_path(ast_path, i), 1));
      }
      root = tree.add_program(std::move(body));
    } else {
      root = builder.build(*ast, ast_path, 0);
    }
    tree.set_root(root);
  } catch (const StructuralError& err) {
    throw ParseError(err.what(), ast_path.empty() ? "/" : ast_path, err.operation());
  }
  return tree;
}

Tree WireParser::parse_text(const std::string& text) const {
  nlohmann::json wire;
  try {
    wire = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& err) {
    throw ParseError(std::string("malformed JSON: ") + err.what(), "/", "json");
  }
  return parse(wire);
}

}  // namespace arbor
