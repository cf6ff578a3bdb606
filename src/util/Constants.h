#pragma once

#include <cstddef>

namespace Marquee {

// ==============================================================================
/**
 * Constants - Centralized magic numbers for the Marquee catalog core
 *
 * Groupings:
 *   - Endpoints: remote metadata service and image CDN
 *   - Api: timeouts, retry limits, backoff
 *   - Cache: offline cache lifetimes and limits
 *   - Coalescing: memo windows per request kind
 *   - Preferences: signal weights, smoothing and scoring weights
 *
 * Every value here is a default. Components take a Config struct seeded from
 * these constants, so tests and deployments can override them.
 */
namespace Constants {
// ==========================================================================
// Endpoints
// ==========================================================================
namespace Endpoints {
constexpr const char *API_BASE_URL = "https://api.themoviedb.org/3";
constexpr const char *IMAGE_BASE_URL = "https://image.tmdb.org/t/p";

constexpr const char *POSTER_SIZE = "w500";
constexpr const char *BACKDROP_SIZE = "original";

constexpr const char *API_HOST = "api.themoviedb.org";
constexpr const char *IMAGE_HOST = "image.tmdb.org";

// Environment overrides
constexpr const char *ENV_API_KEY = "MARQUEE_TMDB_API_KEY";
constexpr const char *ENV_BASE_URL = "MARQUEE_API_BASE_URL";
constexpr const char *ENV_CACHE_DIR = "MARQUEE_CACHE_DIR";
} // namespace Endpoints

// ==========================================================================
// Api
// ==========================================================================
namespace Api {
constexpr int DEFAULT_TIMEOUT_MS = 30000;
constexpr int SEARCH_TIMEOUT_MS = 10000;

// Retries after the first attempt
constexpr int MAX_RETRIES = 3;
constexpr int RETRY_DELAY_BASE_MS = 1000;
constexpr int RETRY_DELAY_MAX_MS = 30000;
constexpr double RETRY_JITTER_FACTOR = 0.5;

// Delay between consecutive pages of a multi-page fetch
constexpr int PAGE_BATCH_DELAY_MS = 100;
constexpr size_t MAX_CONCURRENT_DETAILS = 3;
constexpr int SEARCH_DEBOUNCE_MS = 300;

constexpr int RECENT_RELEASE_MONTHS = 6;
constexpr int RECENT_MIN_VOTE_COUNT = 50;
} // namespace Api

// ==========================================================================
// Cache
// ==========================================================================
namespace Cache {
constexpr int TRENDING_TTL_SECONDS = 60 * 60;
constexpr int NOW_PLAYING_TTL_SECONDS = 60 * 60;
constexpr int POPULAR_TTL_SECONDS = 24 * 60 * 60;
constexpr int TOP_RATED_TTL_SECONDS = 24 * 60 * 60;
constexpr int UPCOMING_TTL_SECONDS = 12 * 60 * 60;
constexpr int RECENT_TTL_SECONDS = 6 * 60 * 60;
constexpr int SEARCH_TTL_SECONDS = 30 * 60;
constexpr int RECOMMENDATIONS_TTL_SECONDS = 2 * 60 * 60;
constexpr int DETAILS_TTL_SECONDS = 24 * 60 * 60;

constexpr size_t MAX_ENTRIES = 500;

// Fixed categories plus recent searches and related-item lists
constexpr size_t MAX_CATEGORIES = 50;

// Entries cached longer ago than this are discarded when loading from disk
constexpr int MAX_PERSISTED_AGE_SECONDS = 7 * 24 * 60 * 60;

constexpr const char *CACHE_FILE_NAME = "catalog_cache.json";
constexpr int CACHE_FORMAT_VERSION = 1;
} // namespace Cache

// ==========================================================================
// Coalescing
// ==========================================================================
namespace Coalescing {
constexpr int DEFAULT_WINDOW_SECONDS = 60;
constexpr int TRENDING_WINDOW_SECONDS = 5 * 60;
constexpr int POPULAR_WINDOW_SECONDS = 10 * 60;
constexpr int TOP_RATED_WINDOW_SECONDS = 60 * 60;
constexpr int NOW_PLAYING_WINDOW_SECONDS = 10 * 60;
constexpr int UPCOMING_WINDOW_SECONDS = 60 * 60;
constexpr int RECENT_WINDOW_SECONDS = 30 * 60;
constexpr int DETAILS_WINDOW_SECONDS = 24 * 60 * 60;
constexpr int SEARCH_WINDOW_SECONDS = 30;
constexpr int RELATED_WINDOW_SECONDS = 30 * 60;
} // namespace Coalescing

// ==========================================================================
// Preferences
// ==========================================================================
namespace Preferences {
constexpr double SUPER_LIKED_WEIGHT = 2.0;
constexpr double LIKED_WEIGHT = 1.0;
constexpr double SKIPPED_WEIGHT = -0.5;

constexpr double RATING_SMOOTHING = 0.9;
constexpr double INITIAL_PREFERRED_RATING = 7.0;

constexpr int RETENTION_DAYS = 30;
constexpr size_t MAX_SIGNALS = 500;

// Score term weights
constexpr double GENRE_WEIGHT = 0.4;
constexpr double RATING_PROXIMITY_WEIGHT = 0.3;
constexpr double RECENCY_WEIGHT = 0.2;
constexpr double HIGH_RATING_WEIGHT = 0.1;

constexpr double HIGH_RATING_THRESHOLD = 7.5;
constexpr double RECENCY_HORIZON_YEARS = 20.0;

// Genres whose accumulated weight falls below this count as disliked
constexpr double DISLIKED_GENRE_THRESHOLD = -1.0;
constexpr int MAX_DISLIKED_GENRES = 3;

constexpr const char *HISTORY_FILE_NAME = "swipe_history.json";
} // namespace Preferences

} // namespace Constants
} // namespace Marquee
