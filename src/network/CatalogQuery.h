#pragma once

#include <juce_core/juce_core.h>
#include <optional>

namespace Marquee {
namespace Network {

// ==============================================================================
/**
 * Browsable listings offered by the metadata service
 */
enum class Category { Trending, Popular, TopRated, NowPlaying, Upcoming, Recent };

/** Stable category name, also used as the offline cache index name ("topRated") */
juce::String categoryName(Category category);
std::optional<Category> categoryFromName(const juce::String &name);

/** Default offline cache lifetime for a category's items */
juce::RelativeTime categoryTtl(Category category);

// ==============================================================================
/**
 * CatalogQuery - A typed request against the remote metadata service
 *
 * A query knows its endpoint path, its query parameters (without the API key)
 * and a cache key that identifies it for request coalescing.
 */
struct CatalogQuery {
  enum class Kind { Listing, Search, Details, Similar, Recommendations };

  Kind kind = Kind::Listing;
  Category category = Category::Popular; // Listing only
  juce::String text;                     // Search only
  int itemId = 0;                        // Details / Similar / Recommendations
  int page = 1;

  // ==========================================================================
  static CatalogQuery listing(Category category, int page = 1);
  static CatalogQuery search(const juce::String &text, int page = 1);
  static CatalogQuery details(int itemId);
  static CatalogQuery similar(int itemId, int page = 1);
  static CatalogQuery recommendations(int itemId, int page = 1);

  // ==========================================================================
  /** Endpoint path relative to the API base URL, e.g. "/movie/popular" */
  juce::String path() const;

  /**
   * Query parameters. "now" anchors the release window of the Recent listing.
   */
  juce::StringPairArray parameters(juce::Time now = juce::Time::getCurrentTime()) const;

  /** Key identifying this query for coalescing, e.g. "popular_1" or "search_dune_2" */
  juce::String cacheKey() const;

  /** A search whose text is empty or whitespace only */
  bool isBlankSearch() const;

  /** Per-attempt timeout: searches are interactive and fail faster */
  int timeoutMs() const;

  /** How long the coalescer may memoize this query's result */
  juce::RelativeTime coalescingWindow() const;

  bool returnsPage() const {
    return kind != Kind::Details;
  }

  juce::String describe() const;

  CatalogQuery withPage(int newPage) const {
    auto copy = *this;
    copy.page = newPage;
    return copy;
  }
};

} // namespace Network
} // namespace Marquee
