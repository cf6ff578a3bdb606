#include "TaskScheduler.h"
#include "Log.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace Marquee {
namespace Util {

TaskScheduler::TaskScheduler(size_t workerCount) {
  size_t poolSize = workerCount;

  if (poolSize == 0) {
    size_t numCores = std::thread::hardware_concurrency();
    if (numCores == 0)
      numCores = 4;
    poolSize = std::min(static_cast<size_t>(8), numCores);
  }

  for (size_t i = 0; i < poolSize; ++i) {
    workers_.emplace_back([this]() { workerThread(); });
  }

  Log::debug("TaskScheduler: started " + juce::String(static_cast<int>(poolSize)) + " workers");
}

TaskScheduler::~TaskScheduler() {
  shutdown();
}

bool TaskScheduler::enqueue(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (shutdown_)
      return false;
    taskQueue_.push(std::move(task));
  }
  conditionVariable_.notify_one();
  return true;
}

bool TaskScheduler::scheduleBackground(std::function<void()> task) {
  auto wrapped = [task]() {
    try {
      task();
    } catch (const std::exception &e) {
      Log::error("TaskScheduler: background task failed - " + juce::String(e.what()));
    } catch (...) {
      Log::error("TaskScheduler: background task failed with a non-standard exception");
    }
  };

  if (!enqueue(wrapped)) {
    Log::warn("TaskScheduler: dropped background task scheduled after shutdown");
    return false;
  }
  return true;
}

void TaskScheduler::workerThread() {
  while (true) {
    std::unique_lock<std::mutex> lock(queueMutex_);

    conditionVariable_.wait(lock, [this]() { return !taskQueue_.empty() || shutdown_; });

    if (taskQueue_.empty()) {
      // Only reachable once shutdown was requested and the queue has drained
      break;
    }

    auto task = std::move(taskQueue_.front());
    taskQueue_.pop();
    activeTaskCount_++;

    lock.unlock();

    // Tasks are wrapped by schedule()/scheduleBackground() and don't throw
    task();

    lock.lock();
    activeTaskCount_--;
    if (taskQueue_.empty() && activeTaskCount_ == 0)
      idleCondition_.notify_all();
  }
}

bool TaskScheduler::waitForAll(int timeoutMs) {
  std::unique_lock<std::mutex> lock(queueMutex_);
  auto idle = [this]() { return taskQueue_.empty() && activeTaskCount_ == 0; };

  if (timeoutMs <= 0) {
    idleCondition_.wait(lock, idle);
    return true;
  }

  return idleCondition_.wait_for(lock, std::chrono::milliseconds(timeoutMs), idle);
}

void TaskScheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (shutdown_.exchange(true))
      return;
  }

  conditionVariable_.notify_all();

  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }

  workers_.clear();
}

} // namespace Util
} // namespace Marquee
