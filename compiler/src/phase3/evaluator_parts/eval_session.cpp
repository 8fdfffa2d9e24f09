#include <chrono>
#include <cstdio>
#include <string>
#include <utility>

#include "eval_session.h"

namespace arbor {

EvalSession::EvalSession(std::shared_ptr<const Tree> tree_in, std::shared_ptr<ToolProvider> provider_in,
                         EvalOptions options_in, CancelToken cancel_in)
    : tree(std::move(tree_in)),
      provider(std::move(provider_in)),
      options(std::move(options_in)),
      cancel(std::move(cancel_in)),
      abandoned(false),
      limiter(options.max_inflight_calls),
      tool_calls(0),
      memo_hits(0),
      nodes_evaluated(0),
      applications(0) {
  if (options.timeout_ms.has_value()) {
    deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(*options.timeout_ms);
  }
}

void EvalSession::prepare() {
  bool has_functions = false;
  for (const auto& node : tree->nodes()) {
    if (node.kind() == NodeKind::Lambda) {
      LambdaScope scope;
      scope.positional = tree->positional_parameter_leaves(node.id);
      scope.dependent = compute_frame_dependence(*tree, node.id, scope.positional);
      scopes_.emplace(node.id, std::move(scope));
    } else if (node.kind() == NodeKind::Function) {
      has_functions = true;
    }
  }

  if (!options.check_tool_availability || !has_functions) {
    return;
  }
  std::vector<ToolDefinition> listed;
  try {
    listed = provider->list_tools();
  } catch (const std::exception& err) {
    throw ToolError(describe_error("list_tools", kNoNode, std::string("tool listing failed: ") + err.what()),
                    kNoNode, "list_tools", err.what());
  }
  for (const auto& tool : listed) {
    tools_.insert(tool.name);
  }
  tools_listed_ = true;
}

bool EvalSession::stop_requested() const {
  if (abandoned.load(std::memory_order_relaxed) || cancel.cancelled()) {
    return true;
  }
  return deadline.has_value() && std::chrono::steady_clock::now() >= *deadline;
}

void EvalSession::check_cancelled(const Node& node) const {
  if (!stop_requested()) {
    return;
  }
  const bool timed_out = !cancel.cancelled() && deadline.has_value() &&
                         std::chrono::steady_clock::now() >= *deadline;
  const char* reason = timed_out ? "deadline exceeded" : "evaluation cancelled";
  if (options.trace) {
    std::fprintf(stderr, "[arbor-eval] cancel node=%u op=%s reason=%s\n", node.id, node.operation().c_str(),
                 reason);
  }
  throw CancelledError(describe_error(node.operation(), node.id, reason), node.id, node.operation());
}

void EvalSession::require_tool(const Node& node) const {
  if (!tools_listed_) {
    return;
  }
  const auto& name = node.as<FunctionNode>().name;
  if (tools_.find(name) == tools_.end()) {
    throw ToolError(describe_error(node.operation(), node.id, "tool '" + name + "' is not available"), node.id,
                    node.operation(), "unknown tool: " + name);
  }
}

Value EvalSession::call_tool(const Node& node, const std::vector<Value>& args) {
  const auto& name = node.as<FunctionNode>().name;
  // A permit is refused only once stopping, so the check below throws then.
  phase9::FanoutPermit permit(limiter, [this]() { return stop_requested(); });
  check_cancelled(node);

  tool_calls.fetch_add(1, std::memory_order_relaxed);
  const auto started = std::chrono::steady_clock::now();
  try {
    auto result = provider->call(name, args);
    if (options.trace) {
      const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);
      std::fprintf(stderr, "[arbor-eval] call node=%u tool=%s args=%zu ms=%.3f\n", node.id, name.c_str(),
                   args.size(), elapsed.count());
    }
    return result;
  } catch (const std::exception& err) {
    if (options.trace) {
      std::fprintf(stderr, "[arbor-eval] call node=%u tool=%s failed: %s\n", node.id, name.c_str(), err.what());
    }
    throw ToolError(describe_error(node.operation(), node.id, std::string("tool call failed: ") + err.what()),
                    node.id, node.operation(), err.what());
  }
}

const LambdaScope& EvalSession::scope_for(NodeId lambda) const {
  const auto it = scopes_.find(lambda);
  if (it == scopes_.end()) {
    throw EvalError(describe_error("lambda", lambda, "node is not a lambda"), lambda, "lambda");
  }
  return it->second;
}

EvalStats EvalSession::stats_snapshot() const {
  EvalStats out;
  out.tool_calls = tool_calls.load(std::memory_order_relaxed);
  out.memo_hits = memo_hits.load(std::memory_order_relaxed);
  out.nodes_evaluated = nodes_evaluated.load(std::memory_order_relaxed);
  out.applications = applications.load(std::memory_order_relaxed);
  return out;
}

}  // namespace arbor
