#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>

#include "phase9_runtime.h"

namespace arbor {
namespace phase9 {

FanoutLimiter::FanoutLimiter(std::size_t limit) : limit_(std::max<std::size_t>(1, limit)) {}

bool FanoutLimiter::acquire(const std::function<bool()>& stop) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (in_flight_ >= limit_) {
    if (stop && stop()) {
      return false;
    }
    cv_.wait_for(lock, std::chrono::milliseconds(1));
  }
  ++in_flight_;
  peak_ = std::max(peak_, in_flight_);
  return true;
}

void FanoutLimiter::release() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (in_flight_ > 0) {
      --in_flight_;
    }
  }
  cv_.notify_one();
}

std::size_t FanoutLimiter::in_flight() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return in_flight_;
}

std::size_t FanoutLimiter::peak() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return peak_;
}

}  // namespace phase9
}  // namespace arbor
