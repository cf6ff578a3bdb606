#include "CatalogQuery.h"
#include "../util/Constants.h"

namespace Marquee {
namespace Network {

// ==============================================================================
juce::String categoryName(Category category) {
  switch (category) {
  case Category::Trending:
    return "trending";
  case Category::Popular:
    return "popular";
  case Category::TopRated:
    return "topRated";
  case Category::NowPlaying:
    return "nowPlaying";
  case Category::Upcoming:
    return "upcoming";
  case Category::Recent:
    return "recent";
  }
  return "popular";
}

std::optional<Category> categoryFromName(const juce::String &name) {
  for (auto category : {Category::Trending, Category::Popular, Category::TopRated, Category::NowPlaying,
                        Category::Upcoming, Category::Recent}) {
    if (categoryName(category) == name)
      return category;
  }
  return std::nullopt;
}

juce::RelativeTime categoryTtl(Category category) {
  using namespace Constants::Cache;

  switch (category) {
  case Category::Trending:
    return juce::RelativeTime::seconds(TRENDING_TTL_SECONDS);
  case Category::Popular:
    return juce::RelativeTime::seconds(POPULAR_TTL_SECONDS);
  case Category::TopRated:
    return juce::RelativeTime::seconds(TOP_RATED_TTL_SECONDS);
  case Category::NowPlaying:
    return juce::RelativeTime::seconds(NOW_PLAYING_TTL_SECONDS);
  case Category::Upcoming:
    return juce::RelativeTime::seconds(UPCOMING_TTL_SECONDS);
  case Category::Recent:
    return juce::RelativeTime::seconds(RECENT_TTL_SECONDS);
  }
  return juce::RelativeTime::seconds(POPULAR_TTL_SECONDS);
}

// ==============================================================================
CatalogQuery CatalogQuery::listing(Category category, int page) {
  CatalogQuery query;
  query.kind = Kind::Listing;
  query.category = category;
  query.page = page;
  return query;
}

CatalogQuery CatalogQuery::search(const juce::String &text, int page) {
  CatalogQuery query;
  query.kind = Kind::Search;
  query.text = text;
  query.page = page;
  return query;
}

CatalogQuery CatalogQuery::details(int itemId) {
  CatalogQuery query;
  query.kind = Kind::Details;
  query.itemId = itemId;
  return query;
}

CatalogQuery CatalogQuery::similar(int itemId, int page) {
  CatalogQuery query;
  query.kind = Kind::Similar;
  query.itemId = itemId;
  query.page = page;
  return query;
}

CatalogQuery CatalogQuery::recommendations(int itemId, int page) {
  CatalogQuery query;
  query.kind = Kind::Recommendations;
  query.itemId = itemId;
  query.page = page;
  return query;
}

// ==============================================================================
juce::String CatalogQuery::path() const {
  switch (kind) {
  case Kind::Listing:
    switch (category) {
    case Category::Trending:
      return "/trending/movie/day";
    case Category::Popular:
      return "/movie/popular";
    case Category::TopRated:
      return "/movie/top_rated";
    case Category::NowPlaying:
      return "/movie/now_playing";
    case Category::Upcoming:
      return "/movie/upcoming";
    case Category::Recent:
      return "/discover/movie";
    }
    break;
  case Kind::Search:
    return "/search/movie";
  case Kind::Details:
    return "/movie/" + juce::String(itemId);
  case Kind::Similar:
    return "/movie/" + juce::String(itemId) + "/similar";
  case Kind::Recommendations:
    return "/movie/" + juce::String(itemId) + "/recommendations";
  }
  return "/movie/popular";
}

juce::StringPairArray CatalogQuery::parameters(juce::Time now) const {
  juce::StringPairArray params;

  if (returnsPage())
    params.set("page", juce::String(page));

  if (kind == Kind::Search) {
    params.set("query", text.trim());
    params.set("include_adult", "false");
  }

  if (kind == Kind::Listing && category == Category::Recent) {
    // Releases of the last few months with enough votes to be meaningful
    auto from = now - juce::RelativeTime::days(30.0 * Constants::Api::RECENT_RELEASE_MONTHS);
    params.set("sort_by", "popularity.desc");
    params.set("include_adult", "false");
    params.set("include_video", "true");
    params.set("primary_release_date.gte", from.formatted("%Y-%m-%d"));
    params.set("primary_release_date.lte", now.formatted("%Y-%m-%d"));
    params.set("vote_count.gte", juce::String(Constants::Api::RECENT_MIN_VOTE_COUNT));
  }

  return params;
}

juce::String CatalogQuery::cacheKey() const {
  switch (kind) {
  case Kind::Listing:
    return categoryName(category) + "_" + juce::String(page);
  case Kind::Search:
    return "search_" + text.trim().toLowerCase() + "_" + juce::String(page);
  case Kind::Details:
    return "details_" + juce::String(itemId);
  case Kind::Similar:
    return "similar_" + juce::String(itemId) + "_" + juce::String(page);
  case Kind::Recommendations:
    return "recommendations_" + juce::String(itemId) + "_" + juce::String(page);
  }
  return {};
}

bool CatalogQuery::isBlankSearch() const {
  return kind == Kind::Search && text.trim().isEmpty();
}

int CatalogQuery::timeoutMs() const {
  return kind == Kind::Search ? Constants::Api::SEARCH_TIMEOUT_MS : Constants::Api::DEFAULT_TIMEOUT_MS;
}

juce::RelativeTime CatalogQuery::coalescingWindow() const {
  using namespace Constants::Coalescing;

  switch (kind) {
  case Kind::Listing:
    switch (category) {
    case Category::Trending:
      return juce::RelativeTime::seconds(TRENDING_WINDOW_SECONDS);
    case Category::Popular:
      return juce::RelativeTime::seconds(POPULAR_WINDOW_SECONDS);
    case Category::TopRated:
      return juce::RelativeTime::seconds(TOP_RATED_WINDOW_SECONDS);
    case Category::NowPlaying:
      return juce::RelativeTime::seconds(NOW_PLAYING_WINDOW_SECONDS);
    case Category::Upcoming:
      return juce::RelativeTime::seconds(UPCOMING_WINDOW_SECONDS);
    case Category::Recent:
      return juce::RelativeTime::seconds(RECENT_WINDOW_SECONDS);
    }
    break;
  case Kind::Search:
    return juce::RelativeTime::seconds(SEARCH_WINDOW_SECONDS);
  case Kind::Details:
    return juce::RelativeTime::seconds(DETAILS_WINDOW_SECONDS);
  case Kind::Similar:
  case Kind::Recommendations:
    return juce::RelativeTime::seconds(RELATED_WINDOW_SECONDS);
  }
  return juce::RelativeTime::seconds(DEFAULT_WINDOW_SECONDS);
}

juce::String CatalogQuery::describe() const {
  switch (kind) {
  case Kind::Listing:
    return categoryName(category) + " page " + juce::String(page);
  case Kind::Search:
    return "search '" + text + "' page " + juce::String(page);
  case Kind::Details:
    return "details " + juce::String(itemId);
  case Kind::Similar:
    return "similar to " + juce::String(itemId) + " page " + juce::String(page);
  case Kind::Recommendations:
    return "recommendations for " + juce::String(itemId) + " page " + juce::String(page);
  }
  return {};
}

} // namespace Network
} // namespace Marquee
