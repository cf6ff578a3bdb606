#pragma once

#include "../models/CatalogItem.h"
#include "../util/Clock.h"
#include "../util/Result.h"
#include <juce_core/juce_core.h>
#include <map>
#include <optional>
#include <vector>

namespace Marquee {
namespace Cache {

// ==============================================================================
/**
 * A cached item with its lifetime. Valid while now < expiresAt.
 */
struct CachedEntry {
  CatalogItem item;
  juce::Time cachedAt;
  juce::Time expiresAt;

  bool isValidAt(juce::Time now) const {
    return now < expiresAt;
  }
};

// ==============================================================================
/**
 * OfflineCatalogCache - Durable store of previously fetched catalog items
 *
 * Items are stored once by id and referenced from named, ordered category
 * indices ("trending", "popular", ...). Each item carries its own expiry, so
 * an item shared by several categories expires independently of the indices
 * that list it.
 *
 * Reads never have side effects and never fail: an expired or unknown id
 * reads as absent. Expired entries are only removed by an explicit
 * evictExpired() sweep, which the owner schedules.
 *
 * An index that loses its last id (eviction, trimming, remove) is dropped.
 * The number of indices is capped as well: per-query indices such as
 * "search:<text>" would otherwise accumulate, so once the cap is exceeded the
 * index written least recently goes first.
 *
 * Every mutation is written through to a JSON file, replaced atomically. A
 * missing or unreadable file at startup yields an empty cache and a warning.
 *
 * Thread safety: a juce::ReadWriteLock serializes writers; readers run
 * concurrently and never observe a partially replaced category index.
 */
class OfflineCatalogCache {
public:
  struct Config {
    juce::File storageFile;  // empty = memory only
    size_t maxEntries = 500;   // oldest entries beyond this are dropped
    size_t maxCategories = 50; // least recently written indices beyond this are dropped
    juce::RelativeTime maxPersistedAge = juce::RelativeTime::days(7.0);

    /** Store under directory/catalog_cache.json */
    static Config inDirectory(const juce::File &directory);

    /** Per-user application data directory */
    static Config defaultLocation();

    /** No persistence */
    static Config inMemory();
  };

  struct Stats {
    size_t totalItems = 0;
    size_t validItems = 0;
    size_t expiredItems = 0;
    std::map<juce::String, size_t> categorySizes;
    juce::uint64 revision = 0; // bumped by every mutation that is written through
  };

  /** Loads any previously persisted state from config.storageFile */
  OfflineCatalogCache(const Config &config, const Util::Clock &clock);

  // ==========================================================================
  /** Cache one item for ttl. Non-positive ttls are ignored. */
  void put(const CatalogItem &item, juce::RelativeTime ttl);

  /** The item, if cached and not expired */
  std::optional<CatalogItem> get(int itemId) const;

  /**
   * Replace the named index with these items, in this order, and cache each
   * item for ttl. An empty list removes the index.
   */
  void putCategory(const juce::String &name, const std::vector<CatalogItem> &items, juce::RelativeTime ttl);

  /** Valid items of the named index in index order. Expired items are skipped. */
  std::vector<CatalogItem> getCategory(const juce::String &name) const;

  /** True if the index exists and more than half of its items are still valid */
  bool hasValid(const juce::String &name) const;

  /**
   * Remove every expired entry and its ids from all indices.
   * @return number of entries removed
   */
  int evictExpired();

  void remove(int itemId);
  void clear();

  // ==========================================================================
  Stats getStats() const;
  juce::StringArray getCategoryNames() const;

  const Config &getConfig() const {
    return config;
  }

private:
  struct CategoryIndex {
    std::vector<int> ids;
    juce::Time updatedAt;
  };

  void putLocked(const CatalogItem &item, juce::Time now, juce::RelativeTime ttl);
  void removeFromIndicesLocked(int itemId);
  void dropEmptyIndicesLocked();
  void trimToCapacityLocked();
  void trimCategoriesLocked(const juce::String &keep);
  void commitLocked();

  Outcome<void> persistLocked() const;
  void loadFromDisk();

  Config config;
  const Util::Clock &clock;

  std::map<int, CachedEntry> entries;
  std::map<juce::String, CategoryIndex> categories;
  juce::uint64 revision = 0;
  mutable juce::ReadWriteLock lock;
};

} // namespace Cache
} // namespace Marquee
