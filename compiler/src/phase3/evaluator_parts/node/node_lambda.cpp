#include "../eval_session.h"

namespace arbor {

Value evaluate_case_lambda(EvalSession&, const Node& node, const FramePtr&) {
  const auto& lambda = node.as<LambdaNode>();
  return Value::closure_value_of(node.id, lambda.params, lambda.body);
}

}  // namespace arbor
