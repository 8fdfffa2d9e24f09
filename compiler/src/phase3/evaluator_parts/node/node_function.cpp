#include <vector>

#include "../eval_session.h"

namespace arbor {

Value evaluate_case_function(EvalSession& session, const Node& node, const FramePtr& frame) {
  const auto& call = node.as<FunctionNode>();
  session.require_tool(node);
  session.check_cancelled(node);
  const auto args = eval_children(session, call.params, frame);
  return session.call_tool(node, args);
}

}  // namespace arbor
