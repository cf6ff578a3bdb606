#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace Marquee {
namespace Util {

/**
 * CancellationToken - Thread-safe token for signaling operation cancellation
 *
 * Used to coordinate cooperative cancellation across threads.
 * Supports:
 * - Checking if cancellation was requested
 * - Registering (and removing) callbacks invoked on cancellation
 * - Sleeping in a way that wakes up early when cancelled (retry backoff)
 *
 * Example:
 *   CancellationTokenSource source;
 *
 *   scheduler.scheduleBackground([token = source.token()]() {
 *       while (!token->isCancellationRequested())
 *       {
 *           doWork();
 *           token->waitFor(std::chrono::milliseconds(250));
 *       }
 *   });
 *
 *   // Later, cancel the operation
 *   source.cancel();
 */
class CancellationToken
{
public:
    using CancellationCallback = std::function<void()>;

    CancellationToken() = default;
    ~CancellationToken() = default;

    /**
     * A token that is never cancelled, for callers that don't need cancellation
     */
    static const CancellationToken& none()
    {
        static const CancellationToken neverCancelled;
        return neverCancelled;
    }

    /**
     * Check if cancellation has been requested
     * @return true if cancel() has been called
     */
    bool isCancellationRequested() const
    {
        return cancelled.load(std::memory_order_acquire);
    }

    /**
     * Request cancellation of the operation
     * Triggers all registered cancellation callbacks exactly once
     */
    void cancel()
    {
        std::map<int, CancellationCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(callbackMutex);
            if (cancelled.exchange(true, std::memory_order_acq_rel))
                return;

            callbacks.swap(cancellationCallbacks);
        }
        waitCondition.notify_all();

        for (auto& entry : callbacks)
        {
            if (entry.second)
                entry.second();
        }
    }

    /**
     * Register a callback to be invoked when cancel() is called.
     * If cancellation was already requested the callback runs immediately.
     * @return id for removeCallback(), or -1 if the callback already ran
     */
    int onCancellation(CancellationCallback callback) const
    {
        if (!callback)
            return -1;

        {
            std::lock_guard<std::mutex> lock(callbackMutex);
            if (!cancelled.load(std::memory_order_acquire))
            {
                int id = nextCallbackId++;
                cancellationCallbacks.emplace(id, std::move(callback));
                return id;
            }
        }

        callback();
        return -1;
    }

    /**
     * Unregister a callback previously returned by onCancellation()
     */
    void removeCallback(int callbackId) const
    {
        if (callbackId < 0)
            return;

        std::lock_guard<std::mutex> lock(callbackMutex);
        cancellationCallbacks.erase(callbackId);
    }

    /**
     * Get number of registered callbacks
     */
    size_t getCallbackCount() const
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        return cancellationCallbacks.size();
    }

    /**
     * Block for up to the given duration, returning early on cancellation.
     * @return true if the full duration elapsed, false if cancelled
     */
    bool waitFor(std::chrono::milliseconds duration) const
    {
        std::unique_lock<std::mutex> lock(callbackMutex);
        return !waitCondition.wait_for(lock, duration, [this]() { return isCancellationRequested(); });
    }

    // Prevent copying
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

private:
    std::atomic<bool> cancelled{false};
    mutable std::mutex callbackMutex;
    mutable std::condition_variable waitCondition;
    mutable std::map<int, CancellationCallback> cancellationCallbacks;
    mutable int nextCallbackId = 0;
};

/**
 * CancellationTokenSource - Owner side of a cancellation token
 *
 * The source hands out a shared token to workers and keeps the right to
 * cancel it. Used by the request coalescer to cancel a shared execution once
 * every caller waiting on it has given up.
 *
 * Example:
 *   CancellationTokenSource source;
 *   auto token = source.token();
 *
 *   // Cancel all operations using this token
 *   source.cancel();
 */
class CancellationTokenSource
{
public:
    CancellationTokenSource()
        : token_(std::make_shared<CancellationToken>())
    {
    }

    /**
     * Get the associated cancellation token
     */
    std::shared_ptr<CancellationToken> token() const
    {
        return token_;
    }

    /**
     * Request cancellation
     */
    void cancel()
    {
        token_->cancel();
    }

    /**
     * Check if cancellation was requested
     */
    bool isCancellationRequested() const
    {
        return token_->isCancellationRequested();
    }

    // Prevent copying
    CancellationTokenSource(const CancellationTokenSource&) = delete;
    CancellationTokenSource& operator=(const CancellationTokenSource&) = delete;

private:
    std::shared_ptr<CancellationToken> token_;
};

}  // namespace Util
}  // namespace Marquee
