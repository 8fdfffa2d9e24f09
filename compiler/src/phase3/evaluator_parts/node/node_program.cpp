#include <memory>
#include <unordered_set>
#include <vector>

#include "../eval_session.h"

namespace arbor {

namespace {

void collect_reachable(const Tree& tree, NodeId id, std::unordered_set<NodeId>& out) {
  if (!out.insert(id).second) {
    return;
  }
  for (const auto child : tree.children(id)) {
    collect_reachable(tree, child, out);
  }
}

// Statements may overlap through shared subtrees; running those concurrently
// would interleave their tool calls, so they keep declared order.
bool statements_disjoint(const Tree& tree, const std::vector<NodeId>& body) {
  std::unordered_set<NodeId> seen;
  for (const auto statement : body) {
    std::unordered_set<NodeId> reach;
    collect_reachable(tree, statement, reach);
    for (const auto id : reach) {
      if (!seen.insert(id).second) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace

Value evaluate_case_program(EvalSession& session, const Node& node, const FramePtr& frame) {
  const auto& program = node.as<ProgramNode>();
  if (program.body.empty()) {
    return Value::nil();
  }

  std::vector<Value> results;
  results.reserve(program.body.size());
  if (session.options.concurrent_statements && program.body.size() > 1 &&
      statements_disjoint(*session.tree, program.body)) {
    results = eval_children(session, program.body, frame);
  } else {
    for (const auto statement : program.body) {
      session.check_cancelled(node);
      results.push_back(eval_node(session, statement, frame));
    }
  }

  if (session.options.program_result == ProgramResult::Last || results.size() == 1) {
    return results.back();
  }
  return Value::list_value_of(std::move(results));
}

}  // namespace arbor
