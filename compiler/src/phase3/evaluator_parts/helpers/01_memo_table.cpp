#include <exception>
#include <future>
#include <mutex>
#include <optional>

#include "../eval_session.h"

namespace arbor {

Value MemoTable::get_or_compute(NodeId id, const std::function<Value()>& compute) {
  std::promise<Value> promise;
  std::optional<std::shared_future<Value>> pending;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto it = entries_.find(id);
    if (it != entries_.end()) {
      pending = it->second;
    } else {
      entries_.emplace(id, promise.get_future().share());
    }
  }

  // Waiting happens outside the lock: the owner inserts descendants here.
  if (pending.has_value()) {
    return pending->get();
  }

  try {
    auto value = compute();
    promise.set_value(value);
    return value;
  } catch (...) {
    promise.set_exception(std::current_exception());
    throw;
  }
}

}  // namespace arbor
