#pragma once

#include "../cache/OfflineCatalogCache.h"
#include "../network/CatalogClient.h"
#include "../network/JuceUrlTransport.h"
#include "../ranking/PreferenceEngine.h"
#include "../util/Constants.h"
#include "../util/Log.h"
#include "../util/Result.h"
#include <juce_core/juce_core.h>
#include <nlohmann/json.hpp>

namespace Marquee {
namespace Core {

// ==============================================================================
/**
 * CoreConfig - Everything needed to assemble a CatalogCore
 *
 * Starts from production defaults. A JSON config file may override any
 * subset of keys; environment variables override the file:
 *
 *   MARQUEE_TMDB_API_KEY   api key
 *   MARQUEE_API_BASE_URL   metadata service base URL
 *   MARQUEE_CACHE_DIR      data directory (cache and swipe history)
 *
 * Example file:
 *   {
 *     "api_key": "...",
 *     "data_directory": "/var/lib/marquee",
 *     "worker_threads": 4,
 *     "retry": {"max_retries": 3, "base_delay_ms": 1000, "max_delay_ms": 30000, "jitter": 0.5},
 *     "requests": {"max_concurrent": 3, "batch_delay_ms": 100, "search_debounce_ms": 300},
 *     "cache": {"max_entries": 500, "max_categories": 50, "max_age_days": 7},
 *     "preferences": {"retention_days": 30, "max_signals": 500, "smoothing": 0.9,
 *                     "weights": {"genre": 0.4, "rating_proximity": 0.3, "recency": 0.2, "high_rating": 0.1}},
 *     "pinned_hosts": ["api.themoviedb.org", "image.tmdb.org"],
 *     "logging": {"level": "info", "console": true, "file": true}
 *   }
 */
struct CoreConfig {
  Network::CatalogClient::Config client;
  Network::JuceUrlTransport::Config transport;
  Cache::OfflineCatalogCache::Config cache;
  Ranking::PreferenceEngine::Config preferences;

  struct Logging {
    Log::Level level = Log::Level::Info;
    bool console = true;
    bool file = true;

    /** Push these settings into the process-wide log */
    void apply() const;
  };

  juce::File dataDirectory;
  size_t workerThreads = 4;
  juce::RelativeTime searchDebounce = juce::RelativeTime::milliseconds(Constants::Api::SEARCH_DEBOUNCE_MS);
  Logging logging;

  /** Production defaults with environment overrides applied */
  static CoreConfig defaults();

  /** defaults(), then the file's keys, then the environment */
  static Outcome<CoreConfig> loadFromFile(const juce::File &file);

  /** Apply the keys present in a parsed config document */
  static Outcome<CoreConfig> fromJson(const nlohmann::json &json, CoreConfig base);

  void applyEnvironment();

  /** Re-point the cache and history files at a new data directory */
  void setDataDirectory(const juce::File &directory);

  juce::File historyFile() const;
};

} // namespace Core
} // namespace Marquee
