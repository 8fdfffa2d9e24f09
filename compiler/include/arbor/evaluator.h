#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "arbor/tool_provider.h"
#include "arbor/tree.h"
#include "arbor/value.h"

namespace arbor {

struct EvalError : public TreeError {
  EvalError(std::string msg, NodeId node, std::string operation)
      : TreeError(std::move(msg), node, std::move(operation)) {}
};

struct UnboundParameterError : public EvalError {
  UnboundParameterError(std::string msg, NodeId node, std::string operation)
      : EvalError(std::move(msg), node, std::move(operation)) {}
};

struct ToolError : public EvalError {
  ToolError(std::string msg, NodeId node, std::string operation, std::string cause)
      : EvalError(std::move(msg), node, std::move(operation)), cause_(std::move(cause)) {}

  const std::string& cause() const { return cause_; }

 private:
  std::string cause_;
};

struct CancelledError : public EvalError {
  CancelledError(std::string msg, NodeId node, std::string operation)
      : EvalError(std::move(msg), node, std::move(operation)) {}
};

class CancelToken {
 public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true, std::memory_order_relaxed); }
  bool cancelled() const { return flag_->load(std::memory_order_relaxed); }
  const std::shared_ptr<std::atomic<bool>>& flag() const { return flag_; }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

enum class ProgramResult {
  Collect,
  Last,
};

struct EvalOptions {
  bool parallel = true;
  std::size_t max_inflight_calls = 8;
  std::optional<long long> timeout_ms;
  bool check_tool_availability = true;
  bool concurrent_statements = false;
  ProgramResult program_result = ProgramResult::Collect;
  bool trace = false;

  static EvalOptions from_env();
};

struct EvalStats {
  std::size_t tool_calls = 0;
  std::size_t memo_hits = 0;
  std::size_t nodes_evaluated = 0;
  std::size_t applications = 0;
};

struct EvalReport {
  Value value;
  EvalStats stats;
};

class Evaluator {
 public:
  explicit Evaluator(std::shared_ptr<ToolProvider> provider,
                     EvalOptions options = EvalOptions::from_env());

  Value evaluate(const Tree& tree, const CancelToken& cancel = CancelToken()) const;
  Value evaluate(std::shared_ptr<const Tree> tree, const CancelToken& cancel = CancelToken()) const;
  EvalReport evaluate_with_report(std::shared_ptr<const Tree> tree,
                                  const CancelToken& cancel = CancelToken()) const;

  const EvalOptions& options() const { return options_; }
  const std::shared_ptr<ToolProvider>& provider() const { return provider_; }

  static bool truthy(const Value& value);

 private:
  std::shared_ptr<ToolProvider> provider_;
  EvalOptions options_;
};

}  // namespace arbor
