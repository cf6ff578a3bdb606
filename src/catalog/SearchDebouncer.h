#pragma once

#include "CatalogRepository.h"
#include "../util/Constants.h"
#include "../util/TaskScheduler.h"
#include "../util/async/CancellationToken.h"
#include <juce_core/juce_core.h>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace Marquee {
namespace Catalog {

// ==============================================================================
/**
 * SearchDebouncer - Live search for a text field
 *
 * Each new search cancels the one before it, then waits out the debounce
 * interval before touching the network. A keystroke burst therefore costs one
 * request: every superseded call returns Cancelled.
 *
 * The last successful first page is remembered, so asking again for the same
 * text returns it without waiting.
 *
 * Usage:
 *   SearchDebouncer debouncer(repository, scheduler);
 *
 *   // on every text change
 *   debouncer.submit(editor.getText(), [](const auto &result) {
 *     if (result.isOk())
 *       showResults(result.getValue());
 *   });
 *
 * submit() waits on a scheduler worker and then runs the search there too,
 * which joins a coalescer flight on another worker. Give the scheduler at
 * least two workers.
 */
class SearchDebouncer {
public:
  using ResultCallback = std::function<void(const CatalogRepository::ListingOutcome &)>;

  SearchDebouncer(CatalogRepository &repository, Util::TaskScheduler &scheduler,
                  juce::RelativeTime interval = juce::RelativeTime::milliseconds(Constants::Api::SEARCH_DEBOUNCE_MS));

  /** Cancels the pending search and waits for submitted ones to finish */
  ~SearchDebouncer();

  /**
   * Debounced search on the calling thread. Returns Cancelled when a later
   * search or cancel() supersedes this one during the wait or the fetch.
   */
  CatalogRepository::ListingOutcome search(const juce::String &text, int page = 1);

  /**
   * search() on a scheduler worker. The callback runs on that worker, also
   * for Cancelled results.
   */
  void submit(const juce::String &text, ResultCallback callback, int page = 1);

  /** Cancel whatever search is pending */
  void cancel();

  /** Forget the remembered first page */
  void clearCache();

  juce::RelativeTime getInterval() const {
    return interval;
  }

private:
  std::shared_ptr<Util::CancellationTokenSource> supersedePending();
  CatalogRepository::ListingOutcome run(const std::shared_ptr<Util::CancellationTokenSource> &source,
                                        const juce::String &text, int page);

  CatalogRepository &repository;
  Util::TaskScheduler &scheduler;
  const juce::RelativeTime interval;

  std::mutex mutex;
  std::condition_variable idle;
  std::shared_ptr<Util::CancellationTokenSource> pending;
  juce::String lastQuery;
  std::optional<Listing> lastResults;
  int submitted = 0;

  SearchDebouncer(const SearchDebouncer &) = delete;
  SearchDebouncer &operator=(const SearchDebouncer &) = delete;
};

} // namespace Catalog
} // namespace Marquee
