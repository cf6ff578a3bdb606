#pragma once

#include "CatalogQuery.h"
#include "RetryPolicy.h"
#include "Transport.h"
#include "TransportError.h"
#include "../models/CatalogItem.h"
#include "../models/CatalogPage.h"
#include "../util/Result.h"
#include "../util/TaskScheduler.h"
#include "../util/async/CancellationToken.h"
#include <juce_core/juce_core.h>
#include <rxcpp/rx.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

namespace Marquee {
namespace Network {

// ==============================================================================
/**
 * CatalogClient - Typed access to the remote metadata service
 *
 * Responsibilities:
 * - Build requests for listings, searches, details and related items
 * - Retry timeouts, rate limits and 5xx responses with exponential backoff
 *   plus jitter, honoring Retry-After on 429
 * - Decode responses into CatalogPage / CatalogItem
 *
 * Never retried: trust failures, decoding errors, other 4xx, lost connectivity
 * and cancellation. The client does not touch the offline cache; the
 * repository layer decides what gets cached.
 *
 * Blank searches return an empty page without any network traffic.
 *
 * Thread safety: fetch() may be called concurrently from any thread. Each
 * call runs its retry loop on the calling thread.
 */
class CatalogClient {
public:
  // ==========================================================================
  struct Config {
    juce::String baseUrl;
    juce::String apiKey;
    RetryPolicy retry = RetryPolicy::standard();
    int pageBatchDelayMs = 100;
    size_t maxConcurrentDetails = 3; // detail requests in flight per batch

    static Config production(const juce::String &apiKey);

    // production() with MARQUEE_TMDB_API_KEY / MARQUEE_API_BASE_URL applied
    static Config fromEnvironment();
  };

  /** Uniform sample in [0, 1) used to jitter backoff delays */
  using JitterSource = std::function<double()>;

  /** Sleeps for the delay; returns false if the token was cancelled first */
  using Sleeper = std::function<bool(juce::RelativeTime, const Util::CancellationToken &)>;

  using PageOutcome = Outcome<CatalogPage, TransportError>;
  using ItemOutcome = Outcome<CatalogItem, TransportError>;
  using ItemsOutcome = Outcome<std::vector<CatalogItem>, TransportError>;

  CatalogClient(Transport &transport, const Config &config);

  // Test seams for deterministic backoff
  void setJitterSource(JitterSource source);
  void setSleeper(Sleeper sleeper);

  // ==========================================================================
  /**
   * Fetch one page for a query. A Details query yields a single-item page.
   */
  PageOutcome fetch(const CatalogQuery &query,
                    const Util::CancellationToken &token = Util::CancellationToken::none());

  /** Fetch one item's details by id */
  ItemOutcome fetchItem(int itemId, const Util::CancellationToken &token = Util::CancellationToken::none());

  /**
   * Fetch pages firstPage..lastPage of a listing in order and concatenate
   * their items. Stops early when the service runs out of pages. The first
   * error aborts the whole batch.
   */
  ItemsOutcome fetchPages(Category category, int firstPage, int lastPage,
                          const Util::CancellationToken &token = Util::CancellationToken::none());

  /**
   * Fetch details for many items in batches of maxConcurrentDetails. The
   * requests of a batch run concurrently on the scheduler; batches are
   * separated by pageBatchDelayMs. Items come back in the order of itemIds.
   * The first error aborts the remaining batches.
   *
   * Blocks the calling thread, so do not call it from one of the scheduler's
   * own workers.
   */
  ItemsOutcome fetchItems(const std::vector<int> &itemIds, Util::TaskScheduler &scheduler,
                          const Util::CancellationToken &token = Util::CancellationToken::none());

  /**
   * Rx wrapper around fetch(). Emits one page and completes, or errors with a
   * TransportException. Unsubscribing cancels the request.
   */
  rxcpp::observable<CatalogPage> fetchObservable(const CatalogQuery &query);

  // ==========================================================================
  const Config &getConfig() const {
    return config;
  }

  /** Total transport attempts made, retries included */
  int getAttemptCount() const {
    return attemptCount.load();
  }

  /** Build the HTTP request for a query, API key included */
  HttpRequest buildRequest(const CatalogQuery &query) const;

  static std::optional<juce::RelativeTime> parseRetryAfter(const juce::String &headerValue);

private:
  Outcome<HttpResponse, TransportError> sendWithRetry(const CatalogQuery &query,
                                                      const Util::CancellationToken &token);

  PageOutcome decodePage(const HttpResponse &response, const CatalogQuery &query) const;
  ItemOutcome decodeItem(const HttpResponse &response, const CatalogQuery &query) const;

  double nextJitter();

  Transport &transport;
  Config config;

  JitterSource jitterSource;
  Sleeper sleeper;

  juce::Random random;
  std::mutex randomMutex;

  std::atomic<int> attemptCount{0};
};

} // namespace Network
} // namespace Marquee
