#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "phase9_runtime.h"

namespace arbor {
namespace phase9 {

namespace {

constexpr std::size_t kNotAWorker = static_cast<std::size_t>(-1);

// Index of the scheduler worker running on this thread, or kNotAWorker.
thread_local std::size_t tls_worker_index = kNotAWorker;

std::size_t configured_worker_count() {
  if (const auto threads = env_integer_value("ARBOR_THREADS"); threads.has_value() && *threads > 0) {
    return static_cast<std::size_t>(*threads);
  }
  const auto hardware = std::thread::hardware_concurrency();
  return hardware == 0 ? 4u : static_cast<std::size_t>(hardware);
}

// Evaluation tasks spawned by a worker go to that worker's own deque, so the
// children of a node stay near the thread that awaits them. Idle workers steal
// the oldest task of a peer.
class TaskScheduler {
 public:
  using Task = std::function<void()>;

  TaskScheduler() : stopping_(false), next_queue_(0), queued_(0), spawned_(0), executed_(0), steals_(0) {
    const auto count = configured_worker_count();
    queues_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      queues_.push_back(std::make_unique<TaskQueue>());
    }
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      threads_.emplace_back([this, i]() { worker_main(i); });
    }
  }

  ~TaskScheduler() {
    {
      std::lock_guard<std::mutex> guard(idle_mutex_);
      stopping_ = true;
    }
    idle_cv_.notify_all();
    for (auto& thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;

  void post(Task task) {
    std::size_t target = tls_worker_index;
    if (target == kNotAWorker || target >= queues_.size()) {
      target = next_queue_.fetch_add(1, std::memory_order_relaxed) % queues_.size();
    }
    {
      std::lock_guard<std::mutex> guard(queues_[target]->mutex);
      queues_[target]->tasks.push_back(std::move(task));
    }
    spawned_.fetch_add(1, std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> guard(idle_mutex_);
      ++queued_;
    }
    idle_cv_.notify_one();
  }

  SchedulerStats stats() const {
    SchedulerStats out;
    out.threads = threads_.size();
    out.spawned = spawned_.load(std::memory_order_relaxed);
    out.executed = executed_.load(std::memory_order_relaxed);
    out.steals = steals_.load(std::memory_order_relaxed);
    return out;
  }

 private:
  struct TaskQueue {
    std::mutex mutex;
    std::deque<Task> tasks;
  };

  // Newest local task first; otherwise the oldest task of the next busy peer.
  bool try_take(std::size_t self, Task& out) {
    {
      auto& own = *queues_[self];
      std::lock_guard<std::mutex> guard(own.mutex);
      if (!own.tasks.empty()) {
        out = std::move(own.tasks.back());
        own.tasks.pop_back();
        return true;
      }
    }
    for (std::size_t step = 1; step < queues_.size(); ++step) {
      auto& peer = *queues_[(self + step) % queues_.size()];
      std::lock_guard<std::mutex> guard(peer.mutex);
      if (peer.tasks.empty()) {
        continue;
      }
      out = std::move(peer.tasks.front());
      peer.tasks.pop_front();
      steals_.fetch_add(1, std::memory_order_relaxed);
      return true;
    }
    return false;
  }

  void worker_main(std::size_t self) {
    tls_worker_index = self;
    for (;;) {
      {
        std::unique_lock<std::mutex> lock(idle_mutex_);
        idle_cv_.wait(lock, [this]() { return stopping_ || queued_ > 0; });
        if (stopping_) {
          return;
        }
      }

      Task task;
      if (!try_take(self, task)) {
        // Another worker took it between the wake-up and the scan.
        std::this_thread::yield();
        continue;
      }
      {
        std::lock_guard<std::mutex> guard(idle_mutex_);
        --queued_;
      }
      task();
      executed_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  std::vector<std::unique_ptr<TaskQueue>> queues_;
  std::vector<std::thread> threads_;

  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  bool stopping_;

  std::atomic<std::size_t> next_queue_;
  std::size_t queued_;
  std::atomic<std::size_t> spawned_;
  std::atomic<std::size_t> executed_;
  std::atomic<std::size_t> steals_;
};

TaskScheduler& scheduler_instance() {
  static TaskScheduler scheduler;
  return scheduler;
}

}  // namespace

std::shared_future<Value> scheduler_submit(std::function<Value()> fn) {
  auto promise = std::make_shared<std::promise<Value>>();
  auto future = promise->get_future().share();
  scheduler_instance().post([fn = std::move(fn), promise]() {
    try {
      promise->set_value(fn());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  });
  return future;
}

void scheduler_submit_fire_and_forget(std::function<void()> fn) { scheduler_instance().post(std::move(fn)); }

bool scheduler_on_worker_thread() { return tls_worker_index != kNotAWorker; }

SchedulerStats scheduler_stats_snapshot() { return scheduler_instance().stats(); }

}  // namespace phase9
}  // namespace arbor
