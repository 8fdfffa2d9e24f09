#include <memory>
#include <vector>

#include "../eval_session.h"

namespace arbor {

namespace {

std::vector<Value> apply_each(EvalSession& session, const Node& site, const Value& closure,
                              const std::vector<Value>& items) {
  std::vector<Value> out;
  out.reserve(items.size());
  if (!session.options.parallel || items.size() < 2) {
    for (const auto& item : items) {
      out.push_back(apply_closure(session, site, closure, {item}));
    }
    return out;
  }

  auto self = session.shared_from_this();
  const auto site_id = site.id;
  std::vector<std::shared_ptr<phase9::ClaimableTask>> tasks;
  tasks.reserve(items.size());
  for (const auto& item : items) {
    tasks.push_back(phase9::spawn_claimable([self, site_id, closure, item]() {
      return apply_closure(*self, self->tree->node(site_id), closure, {item});
    }));
  }
  return phase9::await_all_claimable(tasks);
}

}  // namespace

Value evaluate_case_map(EvalSession& session, const Node& node, const FramePtr& frame) {
  const auto& map = node.as<MapNode>();
  const auto iterable = eval_node(session, map.iterable, frame);
  const auto& items = require_list(node, iterable);
  const auto closure = eval_node(session, map.function, frame);
  return Value::list_value_of(apply_each(session, node, closure, items));
}

Value evaluate_case_filter(EvalSession& session, const Node& node, const FramePtr& frame) {
  const auto& filter = node.as<FilterNode>();
  const auto iterable = eval_node(session, filter.iterable, frame);
  const auto& items = require_list(node, iterable);
  const auto closure = eval_node(session, filter.function, frame);
  const auto verdicts = apply_each(session, node, closure, items);

  std::vector<Value> kept;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (value_is_truthy(verdicts[i])) {
      kept.push_back(items[i]);
    }
  }
  return Value::list_value_of(std::move(kept));
}

}  // namespace arbor
