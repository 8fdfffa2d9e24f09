#include "../eval_session.h"

namespace arbor {

Value evaluate_case_conditional(EvalSession& session, const Node& node, const FramePtr& frame) {
  const auto& branch = node.as<ConditionalNode>();
  const auto predicate = eval_node(session, branch.predicate, frame);
  if (value_is_truthy(predicate)) {
    return eval_node(session, branch.consequent, frame);
  }
  if (branch.alternate == kNoNode) {
    return Value::nil();
  }
  return eval_node(session, branch.alternate, frame);
}

}  // namespace arbor
