#include "CatalogRepository.h"
#include "../util/Constants.h"
#include "../util/Log.h"

namespace Marquee {
namespace Catalog {

using Network::CatalogQuery;
using Network::TransportError;

// ==============================================================================
CatalogRepository::CatalogRepository(Network::CatalogClient &catalogClient, Cache::OfflineCatalogCache &offlineCache,
                                     Util::TaskScheduler &taskScheduler, const Util::Clock &clock)
    : client(catalogClient), cache(offlineCache), scheduler(taskScheduler),
      pageCoalescer(taskScheduler, clock, juce::RelativeTime::seconds(Constants::Coalescing::DEFAULT_WINDOW_SECONDS)),
      itemCoalescer(taskScheduler, clock, juce::RelativeTime::seconds(Constants::Coalescing::DETAILS_WINDOW_SECONDS)) {}

juce::String CatalogRepository::cacheIndexName(const CatalogQuery &query) {
  switch (query.kind) {
  case CatalogQuery::Kind::Listing:
    return Network::categoryName(query.category);
  case CatalogQuery::Kind::Search:
    return "search:" + query.text.trim().toLowerCase();
  case CatalogQuery::Kind::Details:
    return "details:" + juce::String(query.itemId);
  case CatalogQuery::Kind::Similar:
    return "similar:" + juce::String(query.itemId);
  case CatalogQuery::Kind::Recommendations:
    return "recommendations:" + juce::String(query.itemId);
  }
  return {};
}

// ==============================================================================
CatalogRepository::ListingOutcome CatalogRepository::loadCategory(Network::Category category, int page,
                                                                  const Util::CancellationToken &token) {
  return loadPage(CatalogQuery::listing(category, page), Network::categoryTtl(category), token);
}

CatalogRepository::ListingOutcome CatalogRepository::search(const juce::String &text, int page,
                                                            const Util::CancellationToken &token) {
  auto query = CatalogQuery::search(text, page);

  if (query.isBlankSearch()) {
    Listing empty;
    empty.page = page;
    return ListingOutcome::ok(std::move(empty));
  }

  return loadPage(query, juce::RelativeTime::seconds(Constants::Cache::SEARCH_TTL_SECONDS), token);
}

CatalogRepository::ListingOutcome CatalogRepository::loadRelated(const CatalogQuery &query,
                                                                 const Util::CancellationToken &token) {
  if (query.kind != CatalogQuery::Kind::Similar && query.kind != CatalogQuery::Kind::Recommendations)
    return ListingOutcome::error(TransportError::clientError(400, "Not a related-items query: " + query.describe()));

  return loadPage(query, juce::RelativeTime::seconds(Constants::Cache::RECOMMENDATIONS_TTL_SECONDS), token);
}

CatalogRepository::ListingOutcome CatalogRepository::loadPage(const CatalogQuery &query, juce::RelativeTime cacheTtl,
                                                              const Util::CancellationToken &token) {
  const auto indexName = cacheIndexName(query);

  // The producer runs once per flight, so joined and memoized callers never write the cache again
  auto fetched = pageCoalescer.coalesce(
      query.cacheKey(),
      [this, query, indexName, cacheTtl](const Util::CancellationToken &flightToken) {
        auto result = client.fetch(query, flightToken);
        if (result.isOk())
          storePage(query.page, indexName, result.getValue(), cacheTtl);
        return result;
      },
      query.coalescingWindow(), token);

  if (fetched.isOk()) {
    const auto &page = fetched.getValue();

    Listing listing;
    listing.items = page.items;
    listing.page = page.page;
    listing.totalPages = page.totalPages;
    return ListingOutcome::ok(std::move(listing));
  }

  const auto &error = fetched.getError();
  if (error.kind == TransportError::Kind::Cancelled)
    return ListingOutcome::error(error);

  auto cached = cache.getCategory(indexName);
  if (cached.empty()) {
    Log::warn("CatalogRepository: " + query.describe() + " failed with nothing cached - " + error.describe());
    return ListingOutcome::error(error);
  }

  Log::warn("CatalogRepository: serving " + juce::String(static_cast<int>(cached.size())) + " cached items for " +
            query.describe() + " after " + error.describe());

  Listing listing;
  listing.items = std::move(cached);
  listing.page = 1;
  listing.totalPages = 1;
  listing.fromCache = true;
  listing.networkError = error;
  return ListingOutcome::ok(std::move(listing));
}

void CatalogRepository::storePage(int pageNumber, const juce::String &indexName, const CatalogPage &page,
                                  juce::RelativeTime cacheTtl) {
  if (pageNumber == 1) {
    cache.putCategory(indexName, page.items, cacheTtl);
  } else {
    for (const auto &item : page.items)
      cache.put(item, cacheTtl);
  }
}

CatalogRepository::ItemOutcome CatalogRepository::loadItem(int itemId, const Util::CancellationToken &token) {
  auto fetched = itemCoalescer.coalesce(
      itemId,
      [this, itemId](const Util::CancellationToken &flightToken) {
        auto result = client.fetchItem(itemId, flightToken);
        if (result.isOk())
          cache.put(result.getValue(), juce::RelativeTime::seconds(Constants::Cache::DETAILS_TTL_SECONDS));
        return result;
      },
      token);

  if (fetched.isOk()) {
    ItemLookup lookup;
    lookup.item = fetched.getValue();
    return ItemOutcome::ok(std::move(lookup));
  }

  const auto &error = fetched.getError();
  if (error.kind == TransportError::Kind::Cancelled)
    return ItemOutcome::error(error);

  auto cached = cache.get(itemId);
  if (!cached.has_value()) {
    Log::warn("CatalogRepository: item " + juce::String(itemId) + " unavailable - " + error.describe());
    return ItemOutcome::error(error);
  }

  Log::warn("CatalogRepository: serving cached item " + juce::String(itemId) + " after " + error.describe());

  ItemLookup lookup;
  lookup.item = *cached;
  lookup.fromCache = true;
  lookup.networkError = error;
  return ItemOutcome::ok(std::move(lookup));
}

CatalogRepository::ListingOutcome CatalogRepository::loadItems(const std::vector<int> &itemIds,
                                                               const Util::CancellationToken &token) {
  auto fetched = client.fetchItems(itemIds, scheduler, token);

  if (fetched.isOk()) {
    const auto ttl = juce::RelativeTime::seconds(Constants::Cache::DETAILS_TTL_SECONDS);
    for (const auto &item : fetched.getValue())
      cache.put(item, ttl);

    Listing listing;
    listing.items = fetched.getValue();
    listing.totalPages = 1;
    return ListingOutcome::ok(std::move(listing));
  }

  const auto &error = fetched.getError();
  if (error.kind == TransportError::Kind::Cancelled)
    return ListingOutcome::error(error);

  Listing listing;
  for (int itemId : itemIds) {
    auto cached = cache.get(itemId);
    if (!cached.has_value()) {
      Log::warn("CatalogRepository: " + juce::String(static_cast<int>(itemIds.size())) +
                " item batch unavailable - " + error.describe());
      return ListingOutcome::error(error);
    }
    listing.items.push_back(*cached);
  }

  listing.totalPages = 1;
  listing.fromCache = true;
  listing.networkError = error;
  return ListingOutcome::ok(std::move(listing));
}

// ==============================================================================
rxcpp::observable<Listing> CatalogRepository::observeCategory(Network::Category category, int page) {
  return rxcpp::sources::create<Listing>([this, category, page](rxcpp::subscriber<Listing> observer) {
           auto source = std::make_shared<Util::CancellationTokenSource>();
           observer.add(rxcpp::make_subscription([source]() { source->cancel(); }));

           auto result = loadCategory(category, page, *source->token());
           if (!observer.is_subscribed())
             return;

           if (result.isOk()) {
             observer.on_next(result.getValue());
             observer.on_completed();
           } else {
             observer.on_error(std::make_exception_ptr(Network::TransportException(result.getError())));
           }
         })
      .as_dynamic();
}

// ==============================================================================
void CatalogRepository::invalidate(const CatalogQuery &query) {
  if (query.kind == CatalogQuery::Kind::Details)
    itemCoalescer.clearCache(query.itemId);
  else
    pageCoalescer.clearCache(query.cacheKey());
}

void CatalogRepository::invalidateAll() {
  pageCoalescer.clear();
  itemCoalescer.clear();
}

void CatalogRepository::cancelAll() {
  pageCoalescer.cancelAll();
  itemCoalescer.cancelAll();
}

int CatalogRepository::clearExpired() {
  return pageCoalescer.clearExpired() + itemCoalescer.clearExpired();
}

size_t CatalogRepository::getPendingCount() const {
  return pageCoalescer.getPendingCount() + itemCoalescer.getPendingCount();
}

} // namespace Catalog
} // namespace Marquee
