#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "../../phase3/evaluator_parts/internal_helpers.h"

namespace arbor {
namespace phase9 {

struct SchedulerStats {
  std::size_t threads = 0;
  std::size_t spawned = 0;
  std::size_t executed = 0;
  std::size_t steals = 0;
};

std::shared_future<Value> scheduler_submit(std::function<Value()> fn);
void scheduler_submit_fire_and_forget(std::function<void()> fn);
bool scheduler_on_worker_thread();
SchedulerStats scheduler_stats_snapshot();

// Work that runs exactly once, on whichever thread claims it first: a
// scheduler worker, or the task's awaiter when the worker has not started it.
class ClaimableTask {
 public:
  explicit ClaimableTask(std::function<Value()> fn);

  bool try_run();
  bool claimed() const { return claimed_.load(std::memory_order_acquire); }
  const std::shared_future<Value>& future() const { return future_; }

 private:
  std::atomic<bool> claimed_;
  std::function<Value()> fn_;
  std::promise<Value> promise_;
  std::shared_future<Value> future_;
};

std::shared_ptr<ClaimableTask> spawn_claimable(std::function<Value()> fn);
Value await_claimable(const std::shared_ptr<ClaimableTask>& task);
// Waits for every task, then rethrows the first failure in task order.
std::vector<Value> await_all_claimable(const std::vector<std::shared_ptr<ClaimableTask>>& tasks);

enum class AwaitStatus {
  Ready,
  TimedOut,
  Cancelled,
};

AwaitStatus wait_task_ready(const std::shared_future<Value>& future,
                            const std::optional<std::chrono::steady_clock::time_point>& deadline,
                            const std::function<bool()>& cancelled);

// Counting semaphore bounding outstanding tool calls of one evaluation.
class FanoutLimiter {
 public:
  explicit FanoutLimiter(std::size_t limit);

  // False when `stop` fired before a slot became free.
  bool acquire(const std::function<bool()>& stop);
  void release();

  std::size_t limit() const { return limit_; }
  std::size_t in_flight() const;
  std::size_t peak() const;

 private:
  std::size_t limit_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t in_flight_ = 0;
  std::size_t peak_ = 0;
};

class FanoutPermit {
 public:
  FanoutPermit(FanoutLimiter& limiter, const std::function<bool()>& stop)
      : limiter_(limiter), held_(limiter.acquire(stop)) {}
  ~FanoutPermit() {
    if (held_) {
      limiter_.release();
    }
  }
  FanoutPermit(const FanoutPermit&) = delete;
  FanoutPermit& operator=(const FanoutPermit&) = delete;

  bool held() const { return held_; }

 private:
  FanoutLimiter& limiter_;
  bool held_;
};

}  // namespace phase9
}  // namespace arbor
