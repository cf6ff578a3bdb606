#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Marquee {
namespace Util {

/**
 * TaskScheduler - Fixed-size thread pool for background work
 *
 * Owned by the composition root (Core::CatalogCore) and passed by reference to
 * the components that need it. The request coalescer runs each shared
 * producer execution here so that a caller abandoning its wait never strands
 * the other callers.
 *
 * Usage:
 *   TaskScheduler scheduler(4);
 *
 *   auto future = scheduler.schedule<int>([]() { return expensiveComputation(); });
 *   int result = future.get();
 *
 *   scheduler.scheduleBackground([]() { cache.evictExpired(); });
 *
 * Thread safety:
 * - Thread-safe work queue
 * - shutdown() drains queued tasks before joining the workers
 * - Safe to call from any thread
 */
class TaskScheduler {
public:
  /**
   * @param workerCount Number of worker threads (0 = derive from hardware, capped at 8)
   */
  explicit TaskScheduler(size_t workerCount = 0);
  ~TaskScheduler();

  /**
   * Schedule a task to run on the thread pool
   *
   * @param task Function to execute
   * @return std::future for retrieving the result or the exception it threw
   */
  template <typename Result> std::future<Result> schedule(std::function<Result()> task) {
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();

    auto wrappedTask = [task, promise]() {
      try {
        if constexpr (std::is_same_v<Result, void>) {
          task();
          promise->set_value();
        } else {
          promise->set_value(task());
        }
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    };

    if (!enqueue(wrappedTask)) {
      promise->set_exception(std::make_exception_ptr(std::runtime_error("TaskScheduler is shut down")));
    }

    return future;
  }

  /**
   * Schedule a fire-and-forget task. Exceptions are logged, not propagated.
   *
   * @return false if the scheduler is shut down and the task was not queued
   */
  bool scheduleBackground(std::function<void()> task);

  size_t getWorkerCount() const {
    return workers_.size();
  }

  size_t getPendingTaskCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return taskQueue_.size();
  }

  /**
   * Wait for all pending tasks to complete
   *
   * @param timeoutMs Timeout in milliseconds (0 = infinite)
   * @return true if all tasks completed, false if timeout
   */
  bool waitForAll(int timeoutMs = 0);

  /**
   * Shutdown the thread pool
   *
   * Runs every task already queued, then joins the workers. Tasks scheduled
   * after shutdown fail immediately.
   */
  void shutdown();

  bool isShutdown() const {
    return shutdown_.load();
  }

private:
  bool enqueue(std::function<void()> task);
  void workerThread();

  std::vector<std::thread> workers_;

  std::queue<std::function<void()>> taskQueue_;
  mutable std::mutex queueMutex_;
  std::condition_variable conditionVariable_;
  std::condition_variable idleCondition_;

  std::atomic<bool> shutdown_{false};
  int activeTaskCount_ = 0;

  TaskScheduler(const TaskScheduler &) = delete;
  TaskScheduler &operator=(const TaskScheduler &) = delete;
};

} // namespace Util
} // namespace Marquee
