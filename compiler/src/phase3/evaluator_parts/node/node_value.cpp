#include "../eval_session.h"

namespace arbor {

Value evaluate_case_value(EvalSession&, const Node& node, const FramePtr& frame) {
  const auto& leaf = node.as<ValueNode>();
  if (frame) {
    const auto& positional = frame->binding->positional;
    for (std::size_t i = 0; i < positional.size(); ++i) {
      if (positional[i] == node.id) {
        return frame->args[i];
      }
    }
    const auto& params = frame->lambda_node->params;
    for (std::size_t i = 0; i < params.size(); ++i) {
      if (params[i] == leaf.name) {
        return frame->args[i];
      }
    }
  }
  if (leaf.placeholder) {
    throw UnboundParameterError(describe_error(node.operation(), node.id, "parameter '" + leaf.name + "' is unbound"),
                                node.id, node.operation());
  }
  return leaf.value;
}

}  // namespace arbor
