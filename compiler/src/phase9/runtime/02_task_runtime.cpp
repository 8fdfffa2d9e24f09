#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "phase9_runtime.h"

namespace arbor {
namespace phase9 {

ClaimableTask::ClaimableTask(std::function<Value()> fn)
    : claimed_(false), fn_(std::move(fn)), future_(promise_.get_future().share()) {}

bool ClaimableTask::try_run() {
  bool expected = false;
  if (!claimed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return false;
  }
  try {
    promise_.set_value(fn_());
  } catch (...) {
    promise_.set_exception(std::current_exception());
  }
  fn_ = nullptr;
  return true;
}

std::shared_ptr<ClaimableTask> spawn_claimable(std::function<Value()> fn) {
  auto task = std::make_shared<ClaimableTask>(std::move(fn));
  scheduler_submit_fire_and_forget([task]() { (void)task->try_run(); });
  return task;
}

Value await_claimable(const std::shared_ptr<ClaimableTask>& task) {
  // Not started yet: run it here instead of parking this thread.
  (void)task->try_run();
  return task->future().get();
}

std::vector<Value> await_all_claimable(const std::vector<std::shared_ptr<ClaimableTask>>& tasks) {
  std::vector<Value> out;
  out.reserve(tasks.size());
  std::exception_ptr first_error = nullptr;
  for (const auto& task : tasks) {
    (void)task->try_run();
    try {
      out.push_back(task->future().get());
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

AwaitStatus wait_task_ready(const std::shared_future<Value>& future,
                            const std::optional<std::chrono::steady_clock::time_point>& deadline,
                            const std::function<bool()>& cancelled) {
  while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
    if (cancelled && cancelled()) {
      return AwaitStatus::Cancelled;
    }
    auto slice = std::chrono::milliseconds(1);
    if (deadline.has_value()) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          *deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        return AwaitStatus::TimedOut;
      }
      slice = std::min<std::chrono::milliseconds>(slice, remaining);
    }
    (void)future.wait_for(slice);
  }
  return AwaitStatus::Ready;
}

}  // namespace phase9
}  // namespace arbor
