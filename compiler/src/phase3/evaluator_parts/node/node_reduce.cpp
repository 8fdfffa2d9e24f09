#include <vector>

#include "../eval_session.h"

namespace arbor {

Value evaluate_case_reduce(EvalSession& session, const Node& node, const FramePtr& frame) {
  const auto& reduce = node.as<ReduceNode>();
  const auto iterable = eval_node(session, reduce.iterable, frame);
  const auto& items = require_list(node, iterable);
  const auto closure = eval_node(session, reduce.function, frame);

  std::size_t start = 0;
  Value acc = Value::nil();
  if (reduce.initial != kNoNode) {
    acc = eval_node(session, reduce.initial, frame);
  } else if (items.empty()) {
    return Value::nil();
  } else {
    acc = items.front();
    start = 1;
  }

  for (std::size_t i = start; i < items.size(); ++i) {
    acc = apply_closure(session, node, closure, {acc, items[i]});
  }
  return acc;
}

}  // namespace arbor
