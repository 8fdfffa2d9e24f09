#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "arbor/tree.h"

namespace arbor {

inline constexpr const char* kCurrentSchemaVersion = "1.0";

struct ParseError : public TreeError {
  ParseError(std::string msg, std::string path, std::string operation)
      : TreeError(std::move(msg), kNoNode, std::move(operation)), path_(std::move(path)) {}

  // JSON-pointer-like location of the offending wire node.
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

struct ParseOptions {
  std::size_t max_depth = 512;
  // Declared tool arities; functions naming a listed tool must match.
  std::unordered_map<std::string, std::size_t> tool_arity;
  // Reject function names missing from tool_arity.
  bool strict_tools = false;
};

class WireParser {
 public:
  explicit WireParser(ParseOptions options = {});

  Tree parse(const nlohmann::json& wire) const;
  Tree parse_text(const std::string& text) const;

 private:
  ParseOptions options_;
};

struct SerializeOptions {
  bool emit_ids = false;
  bool envelope = false;
};

class WireSerializer {
 public:
  explicit WireSerializer(SerializeOptions options = {});

  nlohmann::ordered_json serialize(const Tree& tree) const;
  std::string serialize_text(const Tree& tree, int indent = -1) const;

 private:
  SerializeOptions options_;
};

// Compact, order-decorated view ("add_1": {...}, "a": [4]). Not invertible.
std::string repr(const Tree& tree);

}  // namespace arbor
