#include "CatalogCore.h"
#include "../network/JuceUrlTransport.h"
#include "../util/Log.h"

namespace Marquee {
namespace Core {

// ==============================================================================
CatalogCore::CatalogCore(const CoreConfig &cfg)
    : CatalogCore(cfg, std::make_unique<Network::JuceUrlTransport>(cfg.transport),
                  std::make_unique<Util::SystemClock>()) {}

CatalogCore::CatalogCore(const CoreConfig &cfg, std::unique_ptr<Network::Transport> customTransport,
                         std::unique_ptr<Util::Clock> customClock)
    : config(cfg), clock(std::move(customClock)), transport(std::move(customTransport)) {
  config.logging.apply();

  scheduler = std::make_unique<Util::TaskScheduler>(config.workerThreads);
  client = std::make_unique<Network::CatalogClient>(*transport, config.client);
  cache = std::make_unique<Cache::OfflineCatalogCache>(config.cache, *clock);
  preferences = std::make_unique<Ranking::PreferenceEngine>(config.preferences, *clock);
  repository = std::make_unique<Catalog::CatalogRepository>(*client, *cache, *scheduler, *clock);
  searchDebouncer = std::make_unique<Catalog::SearchDebouncer>(*repository, *scheduler, config.searchDebounce);

  restoreHistory();

  Log::info("CatalogCore: ready, data directory " + config.dataDirectory.getFullPathName());
}

CatalogCore::~CatalogCore() {
  // Coalescers wait for their producers, which need the client and transport
  searchDebouncer.reset();
  repository.reset();
  scheduler->shutdown();

  if (config.dataDirectory != juce::File())
    preferences->saveTo(config.historyFile()).logIfError("CatalogCore: failed to save swipe history");

  Log::flush();
}

void CatalogCore::restoreHistory() {
  if (config.dataDirectory == juce::File())
    return;

  auto historyFile = config.historyFile();
  if (!historyFile.existsAsFile())
    return;

  // An unreadable history starts a fresh profile
  preferences->loadFrom(historyFile).onError([](const juce::String &error) {
    Log::warn("CatalogCore: ignoring swipe history - " + error);
  });
}

// ==============================================================================
Catalog::CatalogRepository::ListingOutcome CatalogCore::loadDeck(Network::Category category, int page,
                                                                const Util::CancellationToken &token) {
  auto loaded = repository->loadCategory(category, page, token);
  if (loaded.isError())
    return loaded;

  auto listing = loaded.getValue();
  listing.items = preferences->rank(preferences->filterJudged(listing.items));
  return Catalog::CatalogRepository::ListingOutcome::ok(std::move(listing));
}

void CatalogCore::recordJudgment(const CatalogItem &item, Judgment judgment) {
  preferences->record(SwipeSignal::fromItem(item, judgment, clock->now()));

  if (config.dataDirectory != juce::File())
    preferences->saveTo(config.historyFile()).logIfError("CatalogCore: failed to save swipe history");
}

CatalogCore::DownloadReport CatalogCore::downloadForOffline(const std::vector<Network::Category> &categories,
                                                           const Util::CancellationToken &token,
                                                           DownloadProgress progress) {
  DownloadReport report;

  bool expected = false;
  if (!downloading.compare_exchange_strong(expected, true)) {
    Log::info("CatalogCore: offline download already running, skipping");
    report.skipped = true;
    return report;
  }

  struct ClearOnExit {
    std::atomic<bool> &flag;
    ~ClearOnExit() {
      flag.store(false);
    }
  } clearDownloading{downloading};

  Log::info("CatalogCore: downloading " + juce::String(static_cast<int>(categories.size())) +
            " categories for offline use");

  size_t done = 0;
  for (auto category : categories) {
    if (token.isCancellationRequested()) {
      report.failed.emplace_back(category, Network::TransportError::cancelled());
    } else {
      repository->invalidate(Network::CatalogQuery::listing(category));
      auto loaded = repository->loadCategory(category, 1, token);

      if (loaded.isError())
        report.failed.emplace_back(category, loaded.getError());
      else if (loaded.getValue().fromCache)
        report.failed.emplace_back(category, *loaded.getValue().networkError);
      else
        report.stored.push_back(category);
    }

    if (progress)
      progress(++done, categories.size());
  }

  for (const auto &failure : report.failed)
    Log::warn("CatalogCore: could not store " + Network::categoryName(failure.first) + " for offline use - " +
              failure.second.describe());

  report.finishedAt = clock->now();
  {
    std::lock_guard<std::mutex> lock(syncMutex);
    lastOfflineSync = report.finishedAt;
  }

  return report;
}

juce::Time CatalogCore::getLastOfflineSync() const {
  std::lock_guard<std::mutex> lock(syncMutex);
  return lastOfflineSync;
}

void CatalogCore::performMaintenance() {
  auto evicted = cache->evictExpired();
  auto expiredMemos = repository->clearExpired();

  Log::debug("CatalogCore: maintenance evicted " + juce::String(evicted) + " cache entries and " +
             juce::String(expiredMemos) + " memoized results");
}

} // namespace Core
} // namespace Marquee
