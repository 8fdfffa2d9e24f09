#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "../../phase9/runtime/phase9_runtime.h"
#include "internal_helpers.h"

namespace arbor {

// Results of one scope of one evaluation. The first requester of a node
// computes it on its own thread; later requesters wait on the shared future
// and observe the same value or the same failure.
class MemoTable {
 public:
  Value get_or_compute(NodeId id, const std::function<Value()>& compute);

 private:
  std::mutex mutex_;
  std::unordered_map<NodeId, std::shared_future<Value>> entries_;
};

// Binding data of one lambda, computed once per evaluation.
struct LambdaScope {
  std::vector<bool> dependent;
  std::vector<NodeId> positional;
};

// One lambda application. Only nodes marked in `binding->dependent` see this
// frame.
struct EvalFrame {
  NodeId lambda = kNoNode;
  const LambdaNode* lambda_node = nullptr;
  std::vector<Value> args;
  const LambdaScope* binding = nullptr;
  std::shared_ptr<MemoTable> memo;
};

using FramePtr = std::shared_ptr<const EvalFrame>;

// Marks every node whose value depends on the parameters of `lambda`. Nested
// lambdas are opaque: they bind their own parameters only. `positional` holds
// the leaves bound by position (see Tree::positional_parameter_leaves).
std::vector<bool> compute_frame_dependence(const Tree& tree, NodeId lambda, const std::vector<NodeId>& positional);

struct EvalSession : public std::enable_shared_from_this<EvalSession> {
  EvalSession(std::shared_ptr<const Tree> tree_in, std::shared_ptr<ToolProvider> provider_in,
              EvalOptions options_in, CancelToken cancel_in);

  void prepare();

  bool stop_requested() const;
  void check_cancelled(const Node& node) const;
  void require_tool(const Node& node) const;
  Value call_tool(const Node& node, const std::vector<Value>& args);
  const LambdaScope& scope_for(NodeId lambda) const;

  EvalStats stats_snapshot() const;

  std::shared_ptr<const Tree> tree;
  std::shared_ptr<ToolProvider> provider;
  EvalOptions options;
  CancelToken cancel;
  std::atomic<bool> abandoned;
  std::optional<std::chrono::steady_clock::time_point> deadline;
  MemoTable memo;
  phase9::FanoutLimiter limiter;

  std::atomic<std::size_t> tool_calls;
  std::atomic<std::size_t> memo_hits;
  std::atomic<std::size_t> nodes_evaluated;
  std::atomic<std::size_t> applications;

 private:
  std::unordered_map<NodeId, LambdaScope> scopes_;
  bool tools_listed_ = false;
  std::unordered_set<std::string> tools_;
};

using NodeEvalFn = Value (*)(EvalSession&, const Node&, const FramePtr&);

NodeEvalFn node_eval_controller_for_kind(NodeKind kind);
Value eval_node(EvalSession& session, NodeId id, const FramePtr& frame);
// Evaluates `ids` in order; independent non-leaf children run as scheduler
// tasks when the session allows it. Rethrows the first failure by position.
std::vector<Value> eval_children(EvalSession& session, const std::vector<NodeId>& ids,
                                 const FramePtr& frame);
Value apply_closure(EvalSession& session, const Node& site, const Value& closure,
                    std::vector<Value> args);
const std::vector<Value>& require_list(const Node& site, const Value& iterable);

Value evaluate_case_value(EvalSession& session, const Node& node, const FramePtr& frame);
Value evaluate_case_function(EvalSession& session, const Node& node, const FramePtr& frame);
Value evaluate_case_lambda(EvalSession& session, const Node& node, const FramePtr& frame);
Value evaluate_case_map(EvalSession& session, const Node& node, const FramePtr& frame);
Value evaluate_case_filter(EvalSession& session, const Node& node, const FramePtr& frame);
Value evaluate_case_reduce(EvalSession& session, const Node& node, const FramePtr& frame);
Value evaluate_case_conditional(EvalSession& session, const Node& node, const FramePtr& frame);
Value evaluate_case_program(EvalSession& session, const Node& node, const FramePtr& frame);

}  // namespace arbor
