#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "evaluator_parts/eval_session.h"

namespace arbor {

EvalOptions EvalOptions::from_env() {
  EvalOptions options;
  options.parallel = env_flag_enabled("ARBOR_PARALLEL", true);
  if (const auto inflight = env_integer_value("ARBOR_MAX_INFLIGHT"); inflight.has_value() && *inflight > 0) {
    options.max_inflight_calls = static_cast<std::size_t>(*inflight);
  }
  if (const auto timeout = env_integer_value("ARBOR_TIMEOUT_MS"); timeout.has_value() && *timeout >= 0) {
    options.timeout_ms = *timeout;
  }
  options.check_tool_availability = env_flag_enabled("ARBOR_CHECK_TOOLS", true);
  options.concurrent_statements = env_flag_enabled("ARBOR_CONCURRENT_STATEMENTS", false);
  if (const auto* mode = std::getenv("ARBOR_PROGRAM_RESULT")) {
    const std::string value(mode);
    if (value == "last" || value == "Last" || value == "LAST") {
      options.program_result = ProgramResult::Last;
    }
  }
  options.trace = env_flag_enabled("ARBOR_TRACE_EVAL", false);
  return options;
}

Evaluator::Evaluator(std::shared_ptr<ToolProvider> provider, EvalOptions options)
    : provider_(std::move(provider)), options_(std::move(options)) {
  if (!provider_) {
    throw std::invalid_argument("evaluator requires a tool provider");
  }
}

bool Evaluator::truthy(const Value& value) { return value_is_truthy(value); }

Value Evaluator::evaluate(const Tree& tree, const CancelToken& cancel) const {
  return evaluate_with_report(std::make_shared<const Tree>(tree), cancel).value;
}

Value Evaluator::evaluate(std::shared_ptr<const Tree> tree, const CancelToken& cancel) const {
  return evaluate_with_report(std::move(tree), cancel).value;
}

EvalReport Evaluator::evaluate_with_report(std::shared_ptr<const Tree> tree, const CancelToken& cancel) const {
  if (!tree || tree->empty()) {
    throw EvalError(describe_error("evaluate", kNoNode, "tree is empty"), kNoNode, "evaluate");
  }

  auto session = std::make_shared<EvalSession>(std::move(tree), provider_, options_, cancel);
  session->prepare();
  const auto root = session->tree->root();

  EvalReport report;
  // Inline on scheduler workers (a compiled tool called from another
  // evaluation) and in sequential mode; cancellation points still apply.
  if (!options_.parallel || phase9::scheduler_on_worker_thread()) {
    report.value = eval_node(*session, root, nullptr);
    report.stats = session->stats_snapshot();
    return report;
  }

  auto future = phase9::scheduler_submit([session, root]() { return eval_node(*session, root, nullptr); });
  const auto status = phase9::wait_task_ready(future, session->deadline, [&cancel]() { return cancel.cancelled(); });
  if (status != phase9::AwaitStatus::Ready) {
    // In-flight tasks keep the session alive and wind down at their next
    // cancellation point; their results are dropped.
    session->abandoned.store(true, std::memory_order_relaxed);
    const auto& root_node = session->tree->node(root);
    const char* reason = status == phase9::AwaitStatus::TimedOut ? "deadline exceeded" : "evaluation cancelled";
    if (options_.trace) {
      std::fprintf(stderr, "[arbor-eval] abandon root=%u reason=%s\n", root, reason);
    }
    throw CancelledError(describe_error(root_node.operation(), root, reason), root, root_node.operation());
  }

  report.value = future.get();
  report.stats = session->stats_snapshot();
  return report;
}

}  // namespace arbor
