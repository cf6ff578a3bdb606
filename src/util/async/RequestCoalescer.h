#pragma once

#include "CancellationToken.h"
#include "../Clock.h"
#include "../Log.h"
#include "../Result.h"
#include "../TaskScheduler.h"
#include <juce_core/juce_core.h>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace Marquee {
namespace Util {

// ==============================================================================
/**
 * How the coalescer manufactures errors of a given type.
 *
 * The default expects static Error::cancelled() and Error::unknown(message)
 * factories (Network::TransportError has both). Plain message errors are
 * handled by the juce::String specialization below.
 */
template <typename Error> struct CoalescerErrors {
  static Error cancelled() {
    return Error::cancelled();
  }
  static Error fromException(const std::exception &e) {
    return Error::unknown(juce::String(e.what()));
  }
  static Error fromUnknownException() {
    return Error::unknown("non-standard exception");
  }
};

template <> struct CoalescerErrors<juce::String> {
  static juce::String cancelled() {
    return "Request cancelled";
  }
  static juce::String fromException(const std::exception &e) {
    return juce::String(e.what());
  }
  static juce::String fromUnknownException() {
    return "non-standard exception";
  }
};

// ==============================================================================
/**
 * RequestCoalescer - Deduplicates concurrent identical requests
 *
 * All callers asking for the same key while a request for it is running
 * share that single execution and receive the same result or the same error.
 * Successful results can additionally be memoized for a short window so that
 * repeated calls seconds apart don't hit the producer again.
 *
 * Producers run on the TaskScheduler, not on a caller's thread. A caller that
 * cancels its own token stops waiting right away and gets a cancelled error;
 * the shared execution itself is only cancelled once every caller waiting on
 * it has cancelled.
 *
 * On completion the in-flight entry is removed before the memo entry is
 * written, so a call arriving in between starts a fresh execution instead of
 * observing a half-finished one.
 *
 * Usage:
 *   RequestCoalescer<juce::String, CatalogPage, TransportError> coalescer(scheduler, clock);
 *
 *   auto page = coalescer.coalesce("popular_1", [&](const CancellationToken &token) {
 *       return client.fetch(CatalogQuery::listing(Category::Popular), token);
 *   });
 *
 * Key must be ordered (operator<) and Value copyable.
 */
template <typename Key, typename Value, typename Error = juce::String> class RequestCoalescer {
public:
  using Result = Outcome<Value, Error>;
  using Producer = std::function<Result(const CancellationToken &)>;

  RequestCoalescer(TaskScheduler &taskScheduler, const Clock &timeSource,
                   juce::RelativeTime memoWindow = juce::RelativeTime::seconds(60.0))
      : scheduler(taskScheduler), clock(timeSource), defaultWindow(memoWindow), state(std::make_shared<State>()) {}

  /** Cancels outstanding executions and waits for them to wind down */
  ~RequestCoalescer() {
    cancelAll();

    std::unique_lock<std::mutex> lock(state->mutex);
    state->changed.wait(lock, [this]() { return state->runningJobs == 0; });
  }

  // ==========================================================================
  /**
   * Run the producer for this key, or join the execution already running,
   * or return the memoized result. Blocks until a result is available or the
   * caller's token is cancelled.
   */
  Result coalesce(const Key &key, Producer producer, const CancellationToken &token = CancellationToken::none()) {
    return coalesce(key, std::move(producer), defaultWindow, token);
  }

  /**
   * Same as above with a memo window for this key. A zero window disables
   * memoization for the result.
   */
  Result coalesce(const Key &key, Producer producer, juce::RelativeTime window,
                  const CancellationToken &token = CancellationToken::none()) {
    if (token.isCancellationRequested())
      return Result::error(CoalescerErrors<Error>::cancelled());

    // Registered before taking the lock: the callback may run immediately
    auto weakState = std::weak_ptr<State>(state);
    int callbackId = token.onCancellation([weakState]() {
      if (auto s = weakState.lock()) {
        std::lock_guard<std::mutex> lock(s->mutex);
        s->changed.notify_all();
      }
    });

    auto result = awaitFlight(key, std::move(producer), window, token);

    token.removeCallback(callbackId);
    return result;
  }

  // ==========================================================================
  /** Drop the memoized result for one key */
  void clearCache(const Key &key) {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->memo.erase(key);

    auto running = state->inFlight.find(key);
    if (running != state->inFlight.end())
      running->second->memoize = false;
  }

  /** Drop every memoized result. Running executions finish but are not memoized. */
  void clear() {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->memo.clear();

    for (auto &entry : state->inFlight)
      entry.second->memoize = false;
  }

  /** Remove memo entries whose window has passed. Returns how many were removed. */
  int clearExpired() {
    std::lock_guard<std::mutex> lock(state->mutex);
    const auto now = clock.now();
    int removed = 0;

    for (auto it = state->memo.begin(); it != state->memo.end();) {
      if (now >= it->second.expiresAt) {
        it = state->memo.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  /** Cancel the running execution for a key; its waiters receive whatever it returns */
  void cancel(const Key &key) {
    std::shared_ptr<Flight> flight;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      auto running = state->inFlight.find(key);
      if (running == state->inFlight.end())
        return;
      flight = running->second;
      flight->memoize = false;
      state->inFlight.erase(running);
    }
    flight->cancellation.cancel();
  }

  /** Cancel every running execution */
  void cancelAll() {
    std::vector<std::shared_ptr<Flight>> flights;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      for (auto &entry : state->inFlight) {
        entry.second->memoize = false;
        flights.push_back(entry.second);
      }
      state->inFlight.clear();
    }

    for (auto &flight : flights)
      flight->cancellation.cancel();
  }

  // ==========================================================================
  size_t getPendingCount() const {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->inFlight.size();
  }

  size_t getCachedCount() const {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->memo.size();
  }

  /** Number of times any producer has been invoked */
  int getExecutionCount() const {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->executions;
  }

  juce::RelativeTime getDefaultWindow() const {
    return defaultWindow;
  }

private:
  struct Flight {
    CancellationTokenSource cancellation;
    std::optional<Result> result;
    int waiters = 0;
    bool finished = false;
    bool memoize = true;
  };

  struct Memo {
    Value value;
    juce::Time expiresAt;
  };

  struct State {
    std::mutex mutex;
    std::condition_variable changed;
    std::map<Key, std::shared_ptr<Flight>> inFlight;
    std::map<Key, Memo> memo;
    int runningJobs = 0;
    int executions = 0;
  };

  static juce::String describeKey(const Key &key) {
    if constexpr (std::is_constructible_v<juce::String, Key>)
      return juce::String(key);
    else
      return "<key>";
  }

  Result awaitFlight(const Key &key, Producer producer, juce::RelativeTime window, const CancellationToken &token) {
    std::unique_lock<std::mutex> lock(state->mutex);

    auto cached = state->memo.find(key);
    if (cached != state->memo.end()) {
      if (clock.now() < cached->second.expiresAt)
        return Result::ok(cached->second.value);
      state->memo.erase(cached);
    }

    std::shared_ptr<Flight> flight;
    auto running = state->inFlight.find(key);

    if (running != state->inFlight.end()) {
      flight = running->second;
      Log::debug("RequestCoalescer: joining in-flight request " + describeKey(key));
    } else {
      flight = std::make_shared<Flight>();
      state->inFlight.emplace(key, flight);

      if (!launch(key, flight, std::move(producer), window)) {
        state->inFlight.erase(key);
        return Result::error(CoalescerErrors<Error>::cancelled());
      }
    }

    flight->waiters++;
    state->changed.wait(lock, [&]() { return flight->finished || token.isCancellationRequested(); });
    flight->waiters--;

    if (flight->finished)
      return *flight->result;

    // This caller gave up. The execution is abandoned only when nobody else waits.
    if (flight->waiters == 0) {
      auto current = state->inFlight.find(key);
      if (current != state->inFlight.end() && current->second == flight)
        state->inFlight.erase(current);
      flight->memoize = false;

      lock.unlock();
      Log::debug("RequestCoalescer: all callers cancelled " + describeKey(key));
      flight->cancellation.cancel();
    }

    return Result::error(CoalescerErrors<Error>::cancelled());
  }

  // Caller holds state->mutex
  bool launch(const Key &key, std::shared_ptr<Flight> flight, Producer producer, juce::RelativeTime window) {
    state->runningJobs++;
    state->executions++;

    auto sharedState = state;
    const Clock *timeSource = &clock;

    bool queued = scheduler.scheduleBackground([sharedState, timeSource, key, flight, producer, window]() {
      std::optional<Result> outcome;
      try {
        outcome = producer(*flight->cancellation.token());
      } catch (const std::exception &e) {
        Log::error("RequestCoalescer: producer threw for " + describeKey(key) + " - " + juce::String(e.what()));
        outcome = Result::error(CoalescerErrors<Error>::fromException(e));
      } catch (...) {
        Log::error("RequestCoalescer: producer threw a non-standard exception for " + describeKey(key));
        outcome = Result::error(CoalescerErrors<Error>::fromUnknownException());
      }

      {
        std::lock_guard<std::mutex> lock(sharedState->mutex);

        auto current = sharedState->inFlight.find(key);
        if (current != sharedState->inFlight.end() && current->second == flight)
          sharedState->inFlight.erase(current);

        if (outcome->isOk() && flight->memoize && window > juce::RelativeTime())
          sharedState->memo.insert_or_assign(key, Memo{outcome->getValue(), timeSource->now() + window});

        flight->result = std::move(outcome);
        flight->finished = true;
        sharedState->runningJobs--;
      }
      sharedState->changed.notify_all();
    });

    if (!queued) {
      state->runningJobs--;
      state->executions--;
    }
    return queued;
  }

  TaskScheduler &scheduler;
  const Clock &clock;
  const juce::RelativeTime defaultWindow;
  std::shared_ptr<State> state;
};

} // namespace Util
} // namespace Marquee
