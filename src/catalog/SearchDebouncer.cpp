#include "SearchDebouncer.h"
#include "../util/Log.h"
#include <chrono>

namespace Marquee {
namespace Catalog {

// ==============================================================================
SearchDebouncer::SearchDebouncer(CatalogRepository &repo, Util::TaskScheduler &taskScheduler,
                                 juce::RelativeTime debounceInterval)
    : repository(repo), scheduler(taskScheduler), interval(debounceInterval) {}

SearchDebouncer::~SearchDebouncer() {
  cancel();

  std::unique_lock<std::mutex> lock(mutex);
  idle.wait(lock, [this]() { return submitted == 0; });
}

std::shared_ptr<Util::CancellationTokenSource> SearchDebouncer::supersedePending() {
  auto next = std::make_shared<Util::CancellationTokenSource>();

  std::shared_ptr<Util::CancellationTokenSource> previous;
  {
    std::lock_guard<std::mutex> lock(mutex);
    previous = pending;
    pending = next;
  }

  if (previous != nullptr)
    previous->cancel();

  return next;
}

// ==============================================================================
CatalogRepository::ListingOutcome SearchDebouncer::search(const juce::String &text, int page) {
  return run(supersedePending(), text, page);
}

void SearchDebouncer::submit(const juce::String &text, ResultCallback callback, int page) {
  auto source = supersedePending();

  {
    std::lock_guard<std::mutex> lock(mutex);
    ++submitted;
  }

  auto task = [this, source, text, page, callback]() {
    struct Finished {
      SearchDebouncer &owner;
      ~Finished() {
        std::lock_guard<std::mutex> lock(owner.mutex);
        if (--owner.submitted == 0)
          owner.idle.notify_all();
      }
    } finished{*this};

    auto result = run(source, text, page);
    if (callback)
      callback(result);
  };

  if (!scheduler.scheduleBackground(task)) {
    Log::warn("SearchDebouncer: scheduler is shut down, dropping search for '" + text + "'");
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (--submitted == 0)
        idle.notify_all();
    }
    if (callback)
      callback(CatalogRepository::ListingOutcome::error(Network::TransportError::cancelled()));
  }
}

CatalogRepository::ListingOutcome SearchDebouncer::run(const std::shared_ptr<Util::CancellationTokenSource> &source,
                                                       const juce::String &text, int page) {
  const auto query = text.trim();

  if (page == 1) {
    std::lock_guard<std::mutex> lock(mutex);
    if (lastResults.has_value() && query == lastQuery)
      return CatalogRepository::ListingOutcome::ok(*lastResults);
  }

  auto token = source->token();
  if (!token->waitFor(std::chrono::milliseconds(interval.inMilliseconds())))
    return CatalogRepository::ListingOutcome::error(Network::TransportError::cancelled());

  auto result = repository.search(query, page, *token);

  std::lock_guard<std::mutex> lock(mutex);
  if (pending == source)
    pending.reset();

  // Offline fallbacks are not remembered so the next call retries the network
  if (result.isOk() && page == 1 && !result.getValue().fromCache && !token->isCancellationRequested()) {
    lastQuery = query;
    lastResults = result.getValue();
  }

  return result;
}

void SearchDebouncer::cancel() {
  std::shared_ptr<Util::CancellationTokenSource> current;
  {
    std::lock_guard<std::mutex> lock(mutex);
    current.swap(pending);
  }

  if (current != nullptr)
    current->cancel();
}

void SearchDebouncer::clearCache() {
  std::lock_guard<std::mutex> lock(mutex);
  lastQuery.clear();
  lastResults.reset();
}

} // namespace Catalog
} // namespace Marquee
