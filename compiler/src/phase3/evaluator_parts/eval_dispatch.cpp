#include <cstdio>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include "eval_session.h"

namespace arbor {

namespace {

bool is_leaf_kind(NodeKind kind) { return kind == NodeKind::Value || kind == NodeKind::Lambda; }

}  // namespace

NodeEvalFn node_eval_controller_for_kind(NodeKind kind) {
  switch (kind) {
    case NodeKind::Value:
      return &evaluate_case_value;
    case NodeKind::Function:
      return &evaluate_case_function;
    case NodeKind::Lambda:
      return &evaluate_case_lambda;
    case NodeKind::Map:
      return &evaluate_case_map;
    case NodeKind::Filter:
      return &evaluate_case_filter;
    case NodeKind::Reduce:
      return &evaluate_case_reduce;
    case NodeKind::Conditional:
      return &evaluate_case_conditional;
    case NodeKind::Program:
      return &evaluate_case_program;
  }
  return nullptr;
}

Value eval_node(EvalSession& session, NodeId id, const FramePtr& frame) {
  const auto& node = session.tree->node(id);
  // Nodes that do not read the frame's parameters live in the evaluation-wide
  // scope and share its memo entries.
  const FramePtr scope = (frame && frame->binding->dependent[id]) ? frame : nullptr;
  const auto controller = node_eval_controller_for_kind(node.kind());
  if (is_leaf_kind(node.kind())) {
    return controller(session, node, scope);
  }

  auto& memo = scope ? *scope->memo : session.memo;
  bool computed = false;
  auto value = memo.get_or_compute(id, [&]() {
    computed = true;
    session.nodes_evaluated.fetch_add(1, std::memory_order_relaxed);
    return controller(session, node, scope);
  });
  if (!computed) {
    session.memo_hits.fetch_add(1, std::memory_order_relaxed);
    if (session.options.trace) {
      std::fprintf(stderr, "[arbor-eval] memo-hit node=%u op=%s\n", id, node.operation().c_str());
    }
  }
  return value;
}

std::vector<Value> eval_children(EvalSession& session, const std::vector<NodeId>& ids, const FramePtr& frame) {
  std::size_t heavy = 0;
  for (const auto id : ids) {
    if (!is_leaf_kind(session.tree->node(id).kind())) {
      ++heavy;
    }
  }

  std::vector<Value> out;
  out.reserve(ids.size());
  if (!session.options.parallel || heavy < 2) {
    for (const auto id : ids) {
      out.push_back(eval_node(session, id, frame));
    }
    return out;
  }

  auto self = session.shared_from_this();
  std::vector<std::shared_ptr<phase9::ClaimableTask>> tasks(ids.size());
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (is_leaf_kind(session.tree->node(ids[i]).kind())) {
      continue;
    }
    const auto id = ids[i];
    tasks[i] = phase9::spawn_claimable([self, id, frame]() { return eval_node(*self, id, frame); });
  }

  std::exception_ptr first_error = nullptr;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    try {
      if (tasks[i]) {
        out.push_back(phase9::await_claimable(tasks[i]));
      } else {
        out.push_back(eval_node(session, ids[i], frame));
      }
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
      out.push_back(Value::nil());
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return out;
}

Value apply_closure(EvalSession& session, const Node& site, const Value& closure, std::vector<Value> args) {
  if (closure.kind != Value::Kind::Closure || !closure.closure_value) {
    throw EvalError(describe_error(site.operation(), site.id,
                                   std::string("expected lambda, got ") + value_kind_name(closure.kind)),
                    site.id, site.operation());
  }
  const auto& target = *closure.closure_value;
  if (target.params.size() != args.size()) {
    throw EvalError(describe_error(site.operation(), site.id,
                                   "lambda expects " + std::to_string(target.params.size()) +
                                       " argument(s), got " + std::to_string(args.size())),
                    site.id, site.operation());
  }
  session.check_cancelled(site);
  session.applications.fetch_add(1, std::memory_order_relaxed);

  auto frame = std::make_shared<EvalFrame>();
  frame->lambda = target.lambda;
  frame->lambda_node = &session.tree->node(target.lambda).as<LambdaNode>();
  frame->args = std::move(args);
  frame->binding = &session.scope_for(target.lambda);
  frame->memo = std::make_shared<MemoTable>();
  return eval_node(session, target.body, frame);
}

const std::vector<Value>& require_list(const Node& site, const Value& iterable) {
  if (iterable.kind != Value::Kind::List) {
    throw EvalError(describe_error(site.operation(), site.id,
                                   std::string("expected list iterable, got ") + value_kind_name(iterable.kind)),
                    site.id, site.operation());
  }
  return iterable.list_value;
}

}  // namespace arbor
