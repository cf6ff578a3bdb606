#pragma once

#include "../cache/OfflineCatalogCache.h"
#include "../models/CatalogItem.h"
#include "../models/CatalogPage.h"
#include "../network/CatalogClient.h"
#include "../network/CatalogQuery.h"
#include "../network/TransportError.h"
#include "../util/Clock.h"
#include "../util/Result.h"
#include "../util/TaskScheduler.h"
#include "../util/async/CancellationToken.h"
#include "../util/async/RequestCoalescer.h"
#include <juce_core/juce_core.h>
#include <rxcpp/rx.hpp>
#include <optional>
#include <vector>

namespace Marquee {
namespace Catalog {

// ==============================================================================
/**
 * A list of items handed to the presentation layer.
 *
 * fromCache is set when the network failed and the items came from the
 * offline cache instead; networkError then holds the failure that caused the
 * fallback so the UI can show an "offline" hint next to the stale data.
 */
struct Listing {
  std::vector<CatalogItem> items;
  int page = 1;
  int totalPages = 0;
  bool fromCache = false;
  std::optional<Network::TransportError> networkError;

  bool hasMorePages() const {
    return !fromCache && page < totalPages;
  }
};

struct ItemLookup {
  CatalogItem item;
  bool fromCache = false;
  std::optional<Network::TransportError> networkError;
};

// ==============================================================================
/**
 * CatalogRepository - The data path presentation code calls into
 *
 *   caller -> RequestCoalescer -> CatalogClient -> transport
 *
 * Successful fetches are written to the offline cache once per network
 * round trip (first pages replace the category index, later pages only cache
 * their items); callers joining a flight or hitting the memo do not rewrite it. When a fetch
 * fails for any reason other than cancellation the repository falls back to
 * the cached copy, and only surfaces the error when nothing is cached.
 */
class CatalogRepository {
public:
  using PageCoalescer = Util::RequestCoalescer<juce::String, CatalogPage, Network::TransportError>;
  using ItemCoalescer = Util::RequestCoalescer<int, CatalogItem, Network::TransportError>;
  using ListingOutcome = Outcome<Listing, Network::TransportError>;
  using ItemOutcome = Outcome<ItemLookup, Network::TransportError>;

  CatalogRepository(Network::CatalogClient &client, Cache::OfflineCatalogCache &cache,
                    Util::TaskScheduler &scheduler, const Util::Clock &clock);

  // ==========================================================================
  ListingOutcome loadCategory(Network::Category category, int page = 1,
                              const Util::CancellationToken &token = Util::CancellationToken::none());

  /** Blank queries return an empty listing immediately */
  ListingOutcome search(const juce::String &text, int page = 1,
                        const Util::CancellationToken &token = Util::CancellationToken::none());

  /** Similar-items or recommendations for an item */
  ListingOutcome loadRelated(const Network::CatalogQuery &query,
                             const Util::CancellationToken &token = Util::CancellationToken::none());

  ItemOutcome loadItem(int itemId, const Util::CancellationToken &token = Util::CancellationToken::none());

  /**
   * Details for several items, fetched in concurrent batches and cached.
   * When the fetch fails and every requested item is cached, the cached
   * copies are served instead. Must not be called from a scheduler worker.
   */
  ListingOutcome loadItems(const std::vector<int> &itemIds,
                           const Util::CancellationToken &token = Util::CancellationToken::none());

  /** Rx wrapper around loadCategory(); unsubscribing cancels the wait */
  rxcpp::observable<Listing> observeCategory(Network::Category category, int page = 1);

  // ==========================================================================
  /** Forget the memoized result of a query so the next call refetches */
  void invalidate(const Network::CatalogQuery &query);

  /** Forget every memoized result */
  void invalidateAll();

  /** Cancel every in-flight fetch */
  void cancelAll();

  /** Drop expired memo entries, returns how many */
  int clearExpired();

  size_t getPendingCount() const;

  /** Offline cache index name used for a query's first page */
  static juce::String cacheIndexName(const Network::CatalogQuery &query);

private:
  ListingOutcome loadPage(const Network::CatalogQuery &query, juce::RelativeTime cacheTtl,
                          const Util::CancellationToken &token);
  void storePage(int pageNumber, const juce::String &indexName, const CatalogPage &page, juce::RelativeTime cacheTtl);

  Network::CatalogClient &client;
  Cache::OfflineCatalogCache &cache;
  Util::TaskScheduler &scheduler;

  PageCoalescer pageCoalescer;
  ItemCoalescer itemCoalescer;
};

} // namespace Catalog
} // namespace Marquee
