#pragma once

#include <functional>
#include <atomic>

namespace sr {

// Simple cancellation handle
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Execute fn(index, flag) for index = 1..total on at most `concurrency` worker threads.
// - If concurrency <= 1, runs sequentially in index order on the calling thread.
// - If `cancel` is provided and set during execution, tasks will observe cancellation via the token
//   and new tasks will stop being scheduled.
// - Exceptions thrown from fn will be propagated (first exception wins) after all running tasks join.
void for_each_index_concurrent(
    int total,
    int concurrency,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel = nullptr);

} // namespace sr
