#pragma once

#include "CoreConfig.h"
#include "../cache/OfflineCatalogCache.h"
#include "../catalog/CatalogRepository.h"
#include "../catalog/SearchDebouncer.h"
#include "../models/SwipeSignal.h"
#include "../network/CatalogClient.h"
#include "../network/Transport.h"
#include "../ranking/PreferenceEngine.h"
#include "../util/Clock.h"
#include "../util/TaskScheduler.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace Marquee {
namespace Core {

// ==============================================================================
/**
 * CatalogCore - Composition root of the data-access core
 *
 * Builds every component exactly once, wires them together and hands out
 * references. There are no singletons: the application owns one CatalogCore
 * and passes the pieces it needs to whoever needs them.
 *
 * Usage:
 *   auto config = CoreConfig::defaults();
 *   Core::CatalogCore core(config);
 *
 *   auto deck = core.loadDeck(Network::Category::Trending);
 *   core.recordJudgment(item, Judgment::Liked);
 */
class CatalogCore {
public:
  /** What a downloadForOffline() run managed to store */
  struct DownloadReport {
    std::vector<Network::Category> stored;
    std::vector<std::pair<Network::Category, Network::TransportError>> failed;
    bool skipped = false; // another download was already running
    juce::Time finishedAt;

    bool isComplete() const {
      return !skipped && failed.empty();
    }
  };

  /** Called after each category with (categories done, categories requested) */
  using DownloadProgress = std::function<void(size_t, size_t)>;

  /** Production wiring: JUCE URL transport and the system clock */
  explicit CatalogCore(const CoreConfig &config);

  /** Custom transport and clock, used by tests and tools */
  CatalogCore(const CoreConfig &config, std::unique_ptr<Network::Transport> transport,
              std::unique_ptr<Util::Clock> clock);

  /** Persists the swipe history */
  ~CatalogCore();

  // ==========================================================================
  /**
   * A listing ready for the swipe deck: already-judged items removed, the
   * rest ordered by preference score.
   */
  Catalog::CatalogRepository::ListingOutcome
  loadDeck(Network::Category category, int page = 1,
           const Util::CancellationToken &token = Util::CancellationToken::none());

  /** Record a judgment and write the swipe history through to disk */
  void recordJudgment(const CatalogItem &item, Judgment judgment);

  /**
   * Refresh the first page of each category from the network so the decks
   * work offline. Memoized results are bypassed; a category whose fetch fails
   * keeps whatever the cache already had. Only one download runs at a time,
   * a concurrent call returns a skipped report immediately.
   */
  DownloadReport downloadForOffline(const std::vector<Network::Category> &categories,
                                    const Util::CancellationToken &token = Util::CancellationToken::none(),
                                    DownloadProgress progress = nullptr);

  bool isDownloading() const {
    return downloading.load();
  }

  /** When the last download finished, zero if none has */
  juce::Time getLastOfflineSync() const;

  /** Housekeeping for app foreground: expired cache entries and memo entries */
  void performMaintenance();

  // ==========================================================================
  Network::CatalogClient &getClient() {
    return *client;
  }
  Cache::OfflineCatalogCache &getCache() {
    return *cache;
  }
  Ranking::PreferenceEngine &getPreferences() {
    return *preferences;
  }
  Catalog::CatalogRepository &getRepository() {
    return *repository;
  }
  Catalog::SearchDebouncer &getSearchDebouncer() {
    return *searchDebouncer;
  }
  Util::TaskScheduler &getScheduler() {
    return *scheduler;
  }
  const Util::Clock &getClock() const {
    return *clock;
  }
  const CoreConfig &getConfig() const {
    return config;
  }

private:
  void restoreHistory();

  CoreConfig config;

  // Declaration order is construction order; destruction runs in reverse
  std::unique_ptr<Util::Clock> clock;
  std::unique_ptr<Util::TaskScheduler> scheduler;
  std::unique_ptr<Network::Transport> transport;
  std::unique_ptr<Network::CatalogClient> client;
  std::unique_ptr<Cache::OfflineCatalogCache> cache;
  std::unique_ptr<Ranking::PreferenceEngine> preferences;
  std::unique_ptr<Catalog::CatalogRepository> repository;
  std::unique_ptr<Catalog::SearchDebouncer> searchDebouncer;

  std::atomic<bool> downloading{false};
  mutable std::mutex syncMutex;
  juce::Time lastOfflineSync;

  CatalogCore(const CatalogCore &) = delete;
  CatalogCore &operator=(const CatalogCore &) = delete;
};

} // namespace Core
} // namespace Marquee
